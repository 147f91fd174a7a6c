#include <mapr/common/platform.hpp>

#include <cstdlib>

#if defined(MAPR_OS_WINDOWS)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#elif defined(MAPR_OS_POSIX)
#include <pthread.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace mapr::common::platform {

// ============================================================================
// Process / Thread
// ============================================================================

uint64_t get_process_id() noexcept {
#if defined(MAPR_OS_WINDOWS)
    return static_cast<uint64_t>(GetCurrentProcessId());
#elif defined(MAPR_OS_POSIX)
    return static_cast<uint64_t>(getpid());
#else
    return 0;
#endif
}

uint64_t get_thread_id() noexcept {
#if defined(MAPR_OS_WINDOWS)
    return static_cast<uint64_t>(GetCurrentThreadId());
#elif defined(MAPR_OS_MACOS)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(MAPR_OS_POSIX)
    return static_cast<uint64_t>(pthread_self());
#else
    return 0;
#endif
}

// ============================================================================
// Environment
// ============================================================================

std::string get_env(std::string_view name) {
    std::string name_str(name);
#if defined(MAPR_OS_WINDOWS)
    char buffer[32767];
    DWORD result = GetEnvironmentVariableA(name_str.c_str(), buffer, sizeof(buffer));
    if (result > 0 && result < sizeof(buffer)) {
        return std::string(buffer);
    }
    return {};
#else
    const char* value = std::getenv(name_str.c_str());
    return value ? std::string(value) : std::string{};
#endif
}

bool set_env(std::string_view name, std::string_view value) {
    std::string name_str(name);
    std::string value_str(value);
#if defined(MAPR_OS_WINDOWS)
    return SetEnvironmentVariableA(name_str.c_str(), value_str.c_str()) != 0;
#elif defined(MAPR_OS_POSIX)
    return setenv(name_str.c_str(), value_str.c_str(), 1) == 0;
#else
    return false;
#endif
}

bool unset_env(std::string_view name) {
    std::string name_str(name);
#if defined(MAPR_OS_WINDOWS)
    return SetEnvironmentVariableA(name_str.c_str(), nullptr) != 0;
#elif defined(MAPR_OS_POSIX)
    return unsetenv(name_str.c_str()) == 0;
#else
    return false;
#endif
}

}  // namespace mapr::common::platform

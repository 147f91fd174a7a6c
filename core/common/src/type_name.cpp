#include <mapr/common/type_name.hpp>

#include <cctype>
#include <cstdlib>
#include <memory>

#if defined(MAPR_HAS_CXXABI_DEMANGLE)
#include <cxxabi.h>
#endif

namespace mapr::common {

namespace {

constexpr std::string_view ANONYMOUS_NAMESPACE = "(anonymous namespace)";

bool is_identifier_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // anonymous namespace

std::string demangle(const char* mangled) {
    if (mangled == nullptr) {
        return {};
    }
#if defined(MAPR_HAS_CXXABI_DEMANGLE)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> result(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && result) {
        return std::string(result.get());
    }
#endif
    return std::string(mangled);
}

std::string type_name(const std::type_info& type) {
    return demangle(type.name());
}

std::string short_type_name(const std::type_info& type) {
    return strip_namespaces(type_name(type));
}

std::string strip_namespaces(std::string_view qualified) {
    std::string out;
    out.reserve(qualified.size());

    for (size_t i = 0; i < qualified.size(); ++i) {
        if (qualified[i] == ':' && i + 1 < qualified.size() && qualified[i + 1] == ':') {
            // Drop the qualifier that was just emitted
            std::string_view tail(out);
            if (tail.size() >= ANONYMOUS_NAMESPACE.size() &&
                tail.substr(tail.size() - ANONYMOUS_NAMESPACE.size()) == ANONYMOUS_NAMESPACE) {
                out.resize(out.size() - ANONYMOUS_NAMESPACE.size());
            } else {
                while (!out.empty() && is_identifier_char(out.back())) {
                    out.pop_back();
                }
            }
            ++i;
            continue;
        }
        out.push_back(qualified[i]);
    }
    return out;
}

}  // namespace mapr::common

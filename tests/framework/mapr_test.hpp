/**
 * @file mapr_test.hpp
 * @brief Shared fixtures for mapr unit tests
 *
 * Provides:
 * - Sample models (User -> UserDto, Order -> OrderDto)
 * - Sample transformers, including failing and throwing ones
 * - Instrumented ranges that count how often they are walked
 * - A provider that counts and optionally delays provide() calls
 * - Async helpers and Result assertions
 *
 * Usage:
 *   #include <framework/mapr_test.hpp>
 *
 *   TEST(MapperTest, Basic) {
 *       auto mapper = mapr::core::MapperBuilder().add<UserToDto>().build();
 *       ASSERT_RESULT_OK(mapper);
 *   }
 */

#pragma once

#include <mapr/common/debug.hpp>
#include <mapr/common/error.hpp>
#include <mapr/core/mapping/mapper.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace mapr::test {

using namespace mapr::common;
using namespace mapr::core;

// ============================================================================
// Models
// ============================================================================

struct User {
    int64_t id = 0;
    std::string first_name;
    std::string last_name;
};

struct UserDto {
    std::string full_name;

    bool operator==(const UserDto& other) const { return full_name == other.full_name; }
    bool operator!=(const UserDto& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const UserDto& dto) {
    return os << "UserDto{" << dto.full_name << "}";
}

struct Order {
    int64_t id = 0;
    int64_t amount_cents = 0;
};

struct OrderDto {
    std::string label;

    bool operator==(const OrderDto& other) const { return label == other.label; }
};

inline std::ostream& operator<<(std::ostream& os, const OrderDto& dto) {
    return os << "OrderDto{" << dto.label << "}";
}

inline User make_user(int64_t id, std::string first, std::string last) {
    User user;
    user.id = id;
    user.first_name = std::move(first);
    user.last_name = std::move(last);
    return user;
}

inline std::vector<User> make_users(size_t count) {
    std::vector<User> users;
    users.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        users.push_back(make_user(static_cast<int64_t>(i), "First" + std::to_string(i),
                                  "Last" + std::to_string(i)));
    }
    return users;
}

// ============================================================================
// Transformers
// ============================================================================

class UserToDto : public Transformer<User, UserDto> {
public:
    Result<UserDto> transform(const User& user) const override {
        return UserDto{user.first_name + " " + user.last_name};
    }
};

/// Second implementation for the same pair, used to provoke conflicts
class UserToDtoUpperCase : public Transformer<User, UserDto> {
public:
    Result<UserDto> transform(const User& user) const override {
        std::string name = user.first_name + " " + user.last_name;
        for (auto& c : name) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return UserDto{name};
    }
};

class OrderToDto : public Transformer<Order, OrderDto> {
public:
    Result<OrderDto> transform(const Order& order) const override {
        return OrderDto{"#" + std::to_string(order.id) + " " +
                        std::to_string(order.amount_cents / 100) + "." +
                        (order.amount_cents % 100 < 10 ? "0" : "") +
                        std::to_string(order.amount_cents % 100)};
    }
};

/// Fails for negative amounts
class StrictOrderToDto : public Transformer<Order, OrderDto> {
public:
    Result<OrderDto> transform(const Order& order) const override {
        if (order.amount_cents < 0) {
            return Error(ErrorCode::TRANSFORM_FAILED,
                         "Negative amount on order " + std::to_string(order.id))
                .with_context("order_id", std::to_string(order.id));
        }
        return OrderDto{"#" + std::to_string(order.id)};
    }
};

class TransformerFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Throws for users without a last name
class ThrowingUserToDto : public Transformer<User, UserDto> {
public:
    Result<UserDto> transform(const User& user) const override {
        if (user.last_name.empty()) {
            throw TransformerFailure("missing last name for user " + std::to_string(user.id));
        }
        return UserDto{user.first_name + " " + user.last_name};
    }
};

/// Counts every transform() call
class CountingUserToDto : public Transformer<User, UserDto> {
public:
    Result<UserDto> transform(const User& user) const override {
        calls.fetch_add(1);
        return UserDto{user.first_name + " " + user.last_name};
    }

    mutable std::atomic<int> calls{0};
};

/// Not a transformer; discovery must skip it
struct NotATransformer {
    using source_type      = User;
    using destination_type = UserDto;
};

/// Abstract; discovery must skip it
class AbstractUserTransformer : public Transformer<User, UserDto> {};

// ============================================================================
// Instrumented Ranges
// ============================================================================

/**
 * @brief Non-template range of Users counting begin() calls and dereferences
 */
class CountingUserRange {
public:
    struct Counters {
        std::atomic<int> begins{0};
        std::atomic<int> derefs{0};
    };

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = User;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const User*;
        using reference         = const User&;

        iterator() = default;
        iterator(const User* pos, Counters* counters) : pos_(pos), counters_(counters) {}

        reference operator*() const {
            counters_->derefs.fetch_add(1);
            return *pos_;
        }

        iterator& operator++() {
            ++pos_;
            return *this;
        }

        bool operator==(const iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const iterator& other) const { return pos_ != other.pos_; }

    private:
        const User* pos_     = nullptr;
        Counters* counters_ = nullptr;
    };

    explicit CountingUserRange(std::vector<User> users)
        : users_(std::move(users)), counters_(std::make_unique<Counters>()) {}

    iterator begin() const {
        counters_->begins.fetch_add(1);
        return iterator(users_.data(), counters_.get());
    }

    iterator end() const { return iterator(users_.data() + users_.size(), counters_.get()); }

    int begins() const { return counters_->begins.load(); }
    int derefs() const { return counters_->derefs.load(); }

private:
    std::vector<User> users_;
    std::unique_ptr<Counters> counters_;
};

/**
 * @brief Range producing Users by value from ids (prvalue elements)
 */
class GeneratedUserRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = User;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = User;

        iterator() = default;
        explicit iterator(int64_t id) : id_(id) {}

        User operator*() const { return make_user(id_, "Gen" + std::to_string(id_), "User"); }

        iterator& operator++() {
            ++id_;
            return *this;
        }

        bool operator==(const iterator& other) const { return id_ == other.id_; }
        bool operator!=(const iterator& other) const { return id_ != other.id_; }

    private:
        int64_t id_ = 0;
    };

    explicit GeneratedUserRange(int64_t count) : count_(count) {}

    iterator begin() const { return iterator(0); }
    iterator end() const { return iterator(count_); }

private:
    int64_t count_;
};

// ============================================================================
// Providers
// ============================================================================

/**
 * @brief Provider counting provide() calls, optionally slowed down
 */
class CountingProvider : public ITransformerProvider {
public:
    explicit CountingProvider(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {}

    void add(TransformerRegistration registration) {
        std::lock_guard<std::mutex> lock(mutex_);
        registrations_.push_back(std::move(registration));
    }

    std::shared_ptr<const ITransformer> provide(const TypePairKey& key) override {
        calls_.fetch_add(1);
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        TransformerFactory factory;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& registration : registrations_) {
                if (registration.key == key) {
                    factory = registration.factory;
                    break;
                }
            }
        }
        return factory ? factory() : nullptr;
    }

    int calls() const { return calls_.load(); }

private:
    std::chrono::milliseconds delay_;
    std::mutex mutex_;
    std::vector<TransformerRegistration> registrations_;
    std::atomic<int> calls_{0};
};

// ============================================================================
// Async Testing Utilities
// ============================================================================

/**
 * @brief Releases all waiting threads at once
 */
class StartGate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

/**
 * @brief Captures log records in memory for the lifetime of the object
 *
 * Replaces every logger sink and restores a console sink on destruction.
 */
class LogCapture {
public:
    explicit LogCapture(debug::LogLevel level = debug::LogLevel::TRACE) {
        auto& logger = debug::Logger::instance();
        logger.clear_sinks();
        logger.filter().reset();
        logger.set_level(level);
        logger.add_sink(std::make_shared<debug::CallbackSink>([this](const debug::LogRecord& r) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(Entry{r.level, std::string(r.category), r.message});
        }));
    }

    ~LogCapture() {
        auto& logger = debug::Logger::instance();
        logger.clear_sinks();
        logger.filter().reset();
        logger.add_sink(std::make_shared<debug::ConsoleSink>());
    }

    LogCapture(const LogCapture&)            = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    struct Entry {
        debug::LogLevel level;
        std::string category;
        std::string message;
    };

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    bool contains(debug::LogLevel level, const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.level == level && entry.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// ============================================================================
// Test Assertions for mapr Types
// ============================================================================

/**
 * @brief Assert that a Result is successful
 */
#define ASSERT_RESULT_OK(result) \
    ASSERT_TRUE((result).is_success()) << "Expected success, got error: " << (result).error().message()

/**
 * @brief Assert that a Result has a specific error code
 */
#define ASSERT_RESULT_ERROR_CODE(result, expected_code) \
    do { \
        ASSERT_TRUE((result).is_error()) << "Expected error, got success"; \
        ASSERT_EQ((result).error().code(), (expected_code)) << (result).error().message(); \
    } while(0)

/**
 * @brief Expect that a Result is successful
 */
#define EXPECT_RESULT_OK(result) \
    EXPECT_TRUE((result).is_success()) << "Expected success, got error: " << (result).error().message()

/**
 * @brief Expect that a Result has an error
 */
#define EXPECT_RESULT_ERROR(result) \
    EXPECT_TRUE((result).is_error()) << "Expected error, got success"

}  // namespace mapr::test

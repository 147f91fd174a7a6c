#pragma once

/**
 * @file mapped_sequence.hpp
 * @brief Lazy, single-pass sequence of mapping results
 *
 * Elements are produced on demand by a generator; nothing is mapped until the
 * sequence is iterated. All copies share one underlying pass, so iterating a
 * second time continues where the first stopped instead of re-reading the
 * input.
 *
 * @code
 * auto mapped = mapper.map_all<User, UserDto>(users);
 * for (const auto& dto : mapped.value()) {
 *     if (!dto) { handle(dto.error()); continue; }
 *     use(dto.value());
 * }
 * @endcode
 */

#include <mapr/common/error.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace mapr::core {

template<typename T>
class MappedSequence {
    struct State;

public:
    using value_type = common::Result<T>;

    /// Returns the next result, or std::nullopt when exhausted
    using Generator = std::function<std::optional<common::Result<T>>()>;

    explicit MappedSequence(Generator generator)
        : state_(std::make_shared<State>(std::move(generator))) {}

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = common::Result<T>;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const common::Result<T>*;
        using reference         = const common::Result<T>&;

        iterator() = default;

        reference operator*() const { return *state_->current; }
        pointer operator->() const { return &*state_->current; }

        iterator& operator++() {
            state_->advance();
            if (!state_->current) {
                state_ = nullptr;
            }
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.state_ == b.state_;
        }
        friend bool operator!=(const iterator& a, const iterator& b) noexcept { return !(a == b); }

    private:
        friend class MappedSequence;
        explicit iterator(State* state) : state_(state) {}

        State* state_ = nullptr;
    };

    /**
     * @brief Pull the first (or next unread) element
     */
    iterator begin() const {
        if (!state_->current) {
            state_->advance();
        }
        return state_->current ? iterator(state_.get()) : iterator();
    }

    iterator end() const { return iterator(); }

    /**
     * @brief Take the next unread element out of the sequence
     * @return std::nullopt when exhausted
     */
    std::optional<common::Result<T>> next() const {
        if (!state_->current) {
            state_->advance();
        }
        std::optional<common::Result<T>> out;
        out.swap(state_->current);
        return out;
    }

    /**
     * @brief Drain the remaining elements
     * @return All values, or the first error encountered
     */
    common::Result<std::vector<T>> collect() const {
        std::vector<T> values;
        for (auto it = begin(); it != end(); ++it) {
            if (it->is_error()) {
                return it->error();
            }
            values.push_back(it->value());
        }
        return values;
    }

    /**
     * @brief Number of elements pulled from the generator so far
     */
    size_t produced() const noexcept { return state_->produced; }

private:
    struct State {
        explicit State(Generator gen) : generator(std::move(gen)) {}

        void advance() {
            current.reset();
            if (exhausted) {
                return;
            }
            auto next = generator();
            if (next) {
                current.emplace(std::move(*next));
                ++produced;
            } else {
                exhausted = true;
                generator = nullptr;
            }
        }

        Generator generator;
        std::optional<common::Result<T>> current;
        size_t produced = 0;
        bool exhausted  = false;
    };

    std::shared_ptr<State> state_;
};

}  // namespace mapr::core

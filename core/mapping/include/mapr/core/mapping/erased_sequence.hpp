#pragma once

/**
 * @file erased_sequence.hpp
 * @brief Type-erased, single-pass view over an arbitrary range
 *
 * ErasedSequence lets the inferred collection path accept any range whose
 * element type is only interesting at runtime. It records what is statically
 * known about the element type and hands out cursors that pull one element at
 * a time as std::any.
 *
 * Element handling by the range's element type E:
 * | E                                         | element type | absent when    |
 * |-------------------------------------------|--------------|----------------|
 * | T                                         | T            | never          |
 * | std::optional<T>                          | T            | std::nullopt   |
 * | T*, const T*                              | T            | nullptr        |
 * | std::shared_ptr<T>, std::unique_ptr<T>    | T            | nullptr        |
 * | std::any                                  | (runtime)    | empty          |
 *
 * Typed elements are pulled as a borrowed `const T*`; the pointer stays valid
 * until the next pull. std::any elements are pulled by copy.
 *
 * The view does not own the range, which must outlive every cursor.
 */

#include <any>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace mapr::core {

// ============================================================================
// ELEMENT TRAITS
// ============================================================================

/**
 * @brief How a range element maps to an (optional) source value
 */
template<typename E>
struct element_traits {
    using value_type                  = E;
    static constexpr bool is_nullable = false;
    static constexpr bool is_untyped  = false;

    static const value_type* get(const E& element) noexcept { return &element; }
};

template<typename T>
struct element_traits<std::optional<T>> {
    using value_type                  = T;
    static constexpr bool is_nullable = true;
    static constexpr bool is_untyped  = false;

    static const value_type* get(const std::optional<T>& element) noexcept {
        return element ? &*element : nullptr;
    }
};

template<typename T>
struct element_traits<T*> {
    using value_type                  = std::remove_const_t<T>;
    static constexpr bool is_nullable = true;
    static constexpr bool is_untyped  = false;

    static const value_type* get(T* element) noexcept { return element; }
};

template<typename T>
struct element_traits<std::shared_ptr<T>> {
    using value_type                  = std::remove_const_t<T>;
    static constexpr bool is_nullable = true;
    static constexpr bool is_untyped  = false;

    static const value_type* get(const std::shared_ptr<T>& element) noexcept {
        return element.get();
    }
};

template<typename T, typename Deleter>
struct element_traits<std::unique_ptr<T, Deleter>> {
    using value_type                  = std::remove_const_t<T>;
    static constexpr bool is_nullable = true;
    static constexpr bool is_untyped  = false;

    static const value_type* get(const std::unique_ptr<T, Deleter>& element) noexcept {
        return element.get();
    }
};

template<>
struct element_traits<std::any> {
    using value_type                  = std::any;
    static constexpr bool is_nullable = true;
    static constexpr bool is_untyped  = true;
};

namespace detail {

template<typename Range>
using range_iterator_t = decltype(std::begin(std::declval<const Range&>()));

template<typename Range>
using range_sentinel_t = decltype(std::end(std::declval<const Range&>()));

template<typename Range>
using range_element_t =
    std::remove_cv_t<std::remove_reference_t<decltype(*std::declval<range_iterator_t<Range>&>())>>;

/**
 * @brief First type argument of a class template specialization, if any
 */
template<typename C>
struct first_template_argument {
    static constexpr bool value = false;
};

template<template<typename...> class C, typename T, typename... Rest>
struct first_template_argument<C<T, Rest...>> {
    static constexpr bool value = true;
    using type                  = T;
};

/**
 * @brief True when Range = C<E, ...> and E is its element type
 */
template<typename Range, typename = void>
struct has_reified_element : std::false_type {};

template<typename Range>
struct has_reified_element<Range, std::enable_if_t<first_template_argument<Range>::value>>
    : std::is_same<typename first_template_argument<Range>::type, range_element_t<Range>> {};

}  // namespace detail

// ============================================================================
// CURSORS
// ============================================================================

/**
 * @brief Pull-based, single-pass iteration over erased elements
 */
class ErasedCursor {
public:
    virtual ~ErasedCursor() = default;

    /**
     * @brief Pull the next element
     * @param out Receives the element; an empty std::any marks an absent element
     * @return false once the sequence is exhausted
     */
    virtual bool next(std::any& out) = 0;
};

/**
 * @brief Cursor over a borrowed range; begin() is only called on the first pull
 */
template<typename Range>
class RangeCursor final : public ErasedCursor {
public:
    using element_type = detail::range_element_t<Range>;
    using traits       = element_traits<element_type>;

    explicit RangeCursor(const Range& range) : range_(&range) {}

    bool next(std::any& out) override {
        if (!it_) {
            it_.emplace(std::begin(*range_));
            end_.emplace(std::end(*range_));
        } else if (*it_ != *end_) {
            // Advance lazily so the previously pulled element stays alive
            ++*it_;
        }

        if (*it_ == *end_) {
            out.reset();
            return false;
        }

        if constexpr (std::is_reference_v<decltype(**it_)>) {
            erase(**it_, out);
        } else {
            current_.emplace(**it_);
            erase(*current_, out);
        }
        return true;
    }

private:
    static void erase(const element_type& element, std::any& out) {
        if constexpr (traits::is_untyped) {
            out = element;
        } else {
            const auto* value = traits::get(element);
            if (value) {
                out = value;
            } else {
                out.reset();
            }
        }
    }

    const Range* range_;
    std::optional<detail::range_iterator_t<Range>> it_;
    std::optional<detail::range_sentinel_t<Range>> end_;
    std::optional<element_type> current_;
};

// ============================================================================
// ERASED SEQUENCE
// ============================================================================

class ErasedSequence {
public:
    /// An absent sequence
    ErasedSequence() = default;

    /**
     * @brief View over @p range (not owned)
     */
    template<typename Range>
    static ErasedSequence of(const Range& range) {
        using element_type = detail::range_element_t<Range>;
        using traits       = element_traits<element_type>;

        ErasedSequence seq;
        seq.range_type_ = &typeid(Range);
        seq.open_       = [range = &range]() -> std::unique_ptr<ErasedCursor> {
            return std::make_unique<RangeCursor<Range>>(*range);
        };
        if constexpr (!traits::is_untyped) {
            seq.capability_ = &typeid(typename traits::value_type);
            if constexpr (detail::has_reified_element<Range>::value) {
                seq.reified_ = &typeid(typename traits::value_type);
            }
        }
        return seq;
    }

    /// Temporaries would dangle
    template<typename Range>
    static ErasedSequence of(const Range&& range) = delete;

    /**
     * @brief View over a possibly-null range; null gives an absent sequence
     */
    template<typename Range>
    static ErasedSequence of_nullable(const Range* range) {
        return range ? of(*range) : ErasedSequence();
    }

    bool is_present() const noexcept { return static_cast<bool>(open_); }
    explicit operator bool() const noexcept { return is_present(); }

    /**
     * @brief Element type taken from the range's own template argument
     * @return nullptr if the range is not C<E, ...> or E is std::any
     */
    const std::type_info* reified_element_type() const noexcept { return reified_; }

    /**
     * @brief Element type taken from the range's iterator
     * @return nullptr if elements are std::any
     */
    const std::type_info* capability_element_type() const noexcept { return capability_; }

    /**
     * @brief Whether elements are pulled as borrowed `const T*`
     */
    bool is_typed() const noexcept { return capability_ != nullptr; }

    const std::type_info* range_type() const noexcept { return range_type_; }

    /**
     * @brief Start a new pass over the range
     * @return nullptr for an absent sequence
     */
    std::unique_ptr<ErasedCursor> open() const { return open_ ? open_() : nullptr; }

private:
    std::function<std::unique_ptr<ErasedCursor>()> open_;
    const std::type_info* reified_    = nullptr;
    const std::type_info* capability_ = nullptr;
    const std::type_info* range_type_ = nullptr;
};

}  // namespace mapr::core

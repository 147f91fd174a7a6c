#pragma once

/**
 * @file transformer.hpp
 * @brief Transformer interfaces for type-pair mapping
 *
 * A transformer is a pure function from one source value to one destination
 * value. Implementations derive from Transformer<S, D> and implement
 * transform(); the registry and the dispatch caches only see the type-erased
 * ITransformer base.
 *
 * @code
 * class UserToDto : public mapr::core::Transformer<User, UserDto> {
 * public:
 *     Result<UserDto> transform(const User& user) const override {
 *         return UserDto{user.first_name + " " + user.last_name};
 *     }
 * };
 * @endcode
 */

#include <mapr/common/error.hpp>
#include <mapr/common/type_name.hpp>
#include <mapr/core/mapping/type_pair_key.hpp>

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace mapr::core {

using common::Error;
using common::ErrorCode;
using common::Result;

// ============================================================================
// TRANSFORMER INTERFACE
// ============================================================================

/**
 * @brief Type-erased base of every transformer
 *
 * Thread Safety:
 * - transform_erased() is const and must be safe to call concurrently
 * - Instances are immutable once registered
 */
class ITransformer {
public:
    virtual ~ITransformer() = default;

    /**
     * @brief The (source, destination) pair this transformer handles
     */
    virtual TypePairKey key() const noexcept = 0;

    /**
     * @brief Implementation identifier used in diagnostics
     *
     * Defaults to the unqualified class name of the dynamic type.
     */
    virtual std::string name() const { return common::short_type_name(typeid(*this)); }

    /**
     * @brief Apply the transformation to a type-erased source value
     *
     * @param input std::any holding the source value, or a borrowed pointer to it
     * @return std::any holding the destination value, or the transformer's error unchanged
     */
    virtual Result<std::any> transform_erased(const std::any& input) const = 0;
};

namespace detail {

/**
 * @brief Locate an S inside an std::any
 *
 * Accepts a held S as well as borrowed `const S*` / `S*` (used by collection
 * dispatch to avoid copying elements).
 *
 * @return std::nullopt when the any holds something else; a null pointer when
 *         it holds a null S pointer
 */
template<typename S>
std::optional<const S*> any_source(const std::any& input) noexcept {
    if (const S* value = std::any_cast<S>(&input)) {
        return value;
    }
    if (const auto* ptr = std::any_cast<const S*>(&input)) {
        return *ptr;
    }
    if (const auto* ptr = std::any_cast<S*>(&input)) {
        return static_cast<const S*>(*ptr);
    }
    return std::nullopt;
}

template<typename S>
Error source_type_mismatch(const std::any& input) {
    return Error(ErrorCode::TYPE_MISMATCH,
                 "Expected source of type " + common::short_type_name<S>() + " but got " +
                     common::short_type_name(input.type()),
                 MAPR_CURRENT_LOCATION);
}

}  // namespace detail

/**
 * @brief Typed transformer base
 *
 * transform() errors are propagated to callers unchanged. Exceptions thrown
 * from transform() are not caught anywhere in mapr.
 */
template<typename S, typename D>
class Transformer : public ITransformer {
public:
    static_assert(!std::is_reference_v<S> && !std::is_reference_v<D>,
                  "Transformer types must be value types");

    using source_type      = S;
    using destination_type = D;

    virtual Result<D> transform(const S& source) const = 0;

    TypePairKey key() const noexcept final { return TypePairKey::of<S, D>(); }

    Result<std::any> transform_erased(const std::any& input) const final {
        auto result = transform_value(input);
        if (result.is_error()) {
            return result.error();
        }
        if constexpr (std::is_copy_constructible_v<D>) {
            return std::any(std::move(result).value());
        } else {
            return common::err<std::any>(ErrorCode::UNSUPPORTED_TYPE,
                                         common::short_type_name<D>() +
                                             " is not copy constructible and cannot be erased");
        }
    }

    /**
     * @brief Typed result from a type-erased source
     */
    Result<D> transform_value(const std::any& input) const {
        auto source = detail::any_source<S>(input);
        if (!source) {
            return detail::source_type_mismatch<S>(input);
        }
        if (*source == nullptr) {
            return common::err<D>(ErrorCode::INVALID_ARGUMENT, "Source pointer must not be null");
        }
        return transform(**source);
    }
};

// ============================================================================
// FUNCTION TRANSFORMER
// ============================================================================

/**
 * @brief Transformer backed by a callable
 */
template<typename S, typename D>
class FunctionTransformer final : public Transformer<S, D> {
public:
    using Function = std::function<Result<D>(const S&)>;

    FunctionTransformer(std::string name, Function fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    Result<D> transform(const S& source) const override { return fn_(source); }

    std::string name() const override { return name_; }

private:
    std::string name_;
    Function fn_;
};

/**
 * @brief Wrap a callable `Result<D>(const S&)` (or `D(const S&)`) as a transformer
 */
template<typename S, typename D, typename F>
std::shared_ptr<const Transformer<S, D>> make_transformer(std::string name, F&& fn) {
    return std::make_shared<FunctionTransformer<S, D>>(
        std::move(name), typename FunctionTransformer<S, D>::Function(std::forward<F>(fn)));
}

}  // namespace mapr::core

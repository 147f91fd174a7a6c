#pragma once

/**
 * @file registration.hpp
 * @brief Transformer registrations and compile-time discovery
 *
 * A registration is the tuple handed from discovery to the registry:
 * the type pair, the implementation name (for conflict diagnostics) and a
 * factory producing the instance.
 *
 * Discovery is a compile-time filter over a list of classes:
 * @code
 * auto batch = mapr::core::discover<UserToDto, OrderToDto, SomeHelper>();
 * // SomeHelper is not a concrete Transformer<S, D> and is skipped
 * @endcode
 */

#include <mapr/common/type_name.hpp>
#include <mapr/core/mapping/transformer.hpp>
#include <mapr/core/mapping/type_pair_key.hpp>

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace mapr::core {

using TransformerFactory = std::function<std::shared_ptr<const ITransformer>()>;

struct TransformerRegistration {
    TypePairKey key;
    std::string implementation;
    TransformerFactory factory;
};

using RegistrationBatch = std::vector<TransformerRegistration>;

// ============================================================================
// DISCOVERY TRAITS
// ============================================================================

/**
 * @brief True for concrete, default-constructible Transformer<S, D> subclasses
 */
template<typename T, typename = void>
struct is_discoverable_transformer : std::false_type {};

template<typename T>
struct is_discoverable_transformer<
    T, std::void_t<typename T::source_type, typename T::destination_type>>
    : std::bool_constant<
          std::is_base_of_v<Transformer<typename T::source_type, typename T::destination_type>,
                            T> &&
          !std::is_abstract_v<T> && std::is_default_constructible_v<T>> {};

template<typename T>
inline constexpr bool is_discoverable_transformer_v = is_discoverable_transformer<T>::value;

// ============================================================================
// REGISTRATION HELPERS
// ============================================================================

/**
 * @brief Registration for a transformer class
 * @param implementation Name used in diagnostics; defaults to the class name
 */
template<typename T>
TransformerRegistration registration_for(std::string implementation = {}) {
    static_assert(is_discoverable_transformer_v<T>,
                  "T must be a concrete, default-constructible Transformer<S, D>");
    using S = typename T::source_type;
    using D = typename T::destination_type;

    if (implementation.empty()) {
        implementation = common::short_type_name<T>();
    }
    return TransformerRegistration{
        TypePairKey::of<S, D>(), std::move(implementation),
        []() -> std::shared_ptr<const ITransformer> { return std::make_shared<T>(); }};
}

/**
 * @brief Registration for an already constructed instance
 *
 * Every resolution of the key yields this same instance. A null instance is
 * rejected when the batch is registered.
 */
template<typename S, typename D>
TransformerRegistration registration_for_instance(std::shared_ptr<const Transformer<S, D>> instance,
                                                  std::string implementation = {}) {
    if (implementation.empty() && instance) {
        implementation = instance->name();
    }
    return TransformerRegistration{
        TypePairKey::of<S, D>(), std::move(implementation),
        [instance = std::move(instance)]() -> std::shared_ptr<const ITransformer> {
            return instance;
        }};
}

/**
 * @brief Registration for a callable `Result<D>(const S&)`
 */
template<typename S, typename D, typename F>
TransformerRegistration registration_for_function(std::string implementation, F&& fn) {
    auto instance = make_transformer<S, D>(implementation, std::forward<F>(fn));
    return registration_for_instance<S, D>(std::move(instance), std::move(implementation));
}

/**
 * @brief Enumerate transformer classes into one batch
 *
 * Types that are not concrete Transformer<S, D> subclasses are skipped.
 */
template<typename... Ts>
RegistrationBatch discover() {
    RegistrationBatch batch;
    batch.reserve(sizeof...(Ts));
    (
        [&batch] {
            if constexpr (is_discoverable_transformer_v<Ts>) {
                batch.push_back(registration_for<Ts>());
            }
        }(),
        ...);
    return batch;
}

}  // namespace mapr::core

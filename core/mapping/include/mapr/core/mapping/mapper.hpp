#pragma once

/**
 * @file mapper.hpp
 * @brief Public mapping facade
 *
 * Four call shapes, all synchronous and safe to call from many threads:
 *
 * | Shape               | Call                                   | Lookup            |
 * |---------------------|----------------------------------------|-------------------|
 * | Explicit single     | map<S, D>(source)                      | registry          |
 * | Inferred single     | map<D>(std::any) / map(any, typeid(D)) | single dispatch   |
 * | Explicit collection | map_all<S, D>(range)                   | registry          |
 * | Inferred collection | map_all<D>(ErasedSequence)             | collection cache  |
 *
 * Collection results are lazy: elements are mapped while the returned
 * MappedSequence is iterated, in input order, with absent elements dropped.
 *
 * @code
 * auto mapper = mapr::core::MapperBuilder().add<UserToDto>().build();
 * auto dto    = mapper.value()->map<User, UserDto>(user);
 * @endcode
 */

#include <mapr/common/error.hpp>
#include <mapr/common/platform.hpp>
#include <mapr/common/type_name.hpp>
#include <mapr/core/mapping/collection_inferencer.hpp>
#include <mapr/core/mapping/dispatch_cache.hpp>
#include <mapr/core/mapping/erased_sequence.hpp>
#include <mapr/core/mapping/mapped_sequence.hpp>
#include <mapr/core/mapping/registration.hpp>
#include <mapr/core/mapping/transformer.hpp>
#include <mapr/core/mapping/transformer_provider.hpp>
#include <mapr/core/mapping/transformer_registry.hpp>

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace mapr::core {

/**
 * @brief Mapper tuning
 */
struct MapperConfig {
    /// Applies to both the single and the collection dispatch cache
    DispatchCacheConfig dispatch_cache;
};

/// Cached closure for one (runtime source type, destination) pair
using ErasedInvoker = std::function<common::Result<std::any>(const std::any&)>;

/// Cached closure for one (element type, destination) pair
using CollectionInvoker = std::function<common::Result<MappedSequence<std::any>>(
    std::shared_ptr<ErasedCursor>)>;

namespace detail {

template<typename D>
common::Result<D> unerase(common::Result<std::any> erased) {
    if (erased.is_error()) {
        return erased.error();
    }
    auto* value = std::any_cast<D>(&erased.value());
    if (!value) {
        return common::err<D>(common::ErrorCode::TYPE_MISMATCH,
                              "Transformer produced " +
                                  common::short_type_name(erased.value().type()) +
                                  " where " + common::short_type_name<D>() + " was requested");
    }
    return std::move(*value);
}

}  // namespace detail

class Mapper {
public:
    explicit Mapper(std::shared_ptr<TransformerRegistry> registry, MapperConfig config = {});
    ~Mapper();

    Mapper(const Mapper&)            = delete;
    Mapper& operator=(const Mapper&) = delete;

    // ========================================================================
    // SINGLE VALUES
    // ========================================================================

    template<typename S, typename D>
    common::Result<D> map(const S& source) {
        auto transformer = registry_->resolve<S, D>();
        if (transformer.is_error()) {
            return transformer.error();
        }
        return transformer.value()->transform(source);
    }

    /**
     * @return INVALID_ARGUMENT for a null @p source, before any lookup
     */
    template<typename S, typename D>
    common::Result<D> map(const S* source) {
        if (!source) {
            return common::err<D>(common::ErrorCode::INVALID_ARGUMENT,
                                  "Source object must not be null");
        }
        return map<S, D>(*source);
    }

    /**
     * @brief Map using the runtime type of @p source
     *
     * @return INVALID_ARGUMENT for an empty @p source; MAPPER_NOT_FOUND when
     *         no transformer exists for (source.type(), destination)
     */
    common::Result<std::any> map(const std::any& source, const std::type_info& destination);

    template<typename D>
    common::Result<D> map(const std::any& source) {
        return detail::unerase<D>(map(source, typeid(D)));
    }

    // ========================================================================
    // COLLECTIONS
    // ========================================================================

    /**
     * @brief Lazily map every present element of @p range
     *
     * The transformer is resolved now; @p range is read while the result is
     * iterated and must outlive it.
     */
    template<typename S, typename D, typename Range,
             std::enable_if_t<!std::is_pointer_v<Range>, int> = 0>
    common::Result<MappedSequence<D>> map_all(const Range& range) {
        using traits = element_traits<detail::range_element_t<Range>>;
        static_assert(traits::is_untyped || std::is_same_v<typename traits::value_type, S>,
                      "Range elements must be S, a nullable S or std::any");

        auto resolved = registry_->resolve<S, D>();
        if (resolved.is_error()) {
            return resolved.error();
        }

        std::shared_ptr<const Transformer<S, D>> transformer = std::move(resolved).value();
        auto cursor = std::make_shared<RangeCursor<Range>>(range);
        return MappedSequence<D>(
            [transformer = std::move(transformer),
             cursor      = std::move(cursor)]() -> std::optional<common::Result<D>> {
                std::any element;
                while (cursor->next(element)) {
                    if (element.has_value()) {
                        return transformer->transform_value(element);
                    }
                }
                return std::nullopt;
            });
    }

    /// Temporaries would dangle
    template<typename S, typename D, typename Range,
             std::enable_if_t<!std::is_pointer_v<Range>, int> = 0>
    common::Result<MappedSequence<D>> map_all(const Range&& range) = delete;

    /**
     * @return INVALID_ARGUMENT for a null @p range
     */
    template<typename S, typename D, typename Range>
    common::Result<MappedSequence<D>> map_all(const Range* range) {
        if (!range) {
            return common::err<MappedSequence<D>>(common::ErrorCode::INVALID_ARGUMENT,
                                                  "Source collection must not be null");
        }
        return map_all<S, D>(*range);
    }

    /**
     * @brief Lazily map a collection whose element type is found at runtime
     *
     * @return INVALID_ARGUMENT for an absent sequence; TYPE_INFERENCE_FAILED
     *         when the element type cannot be determined; MAPPER_NOT_FOUND
     *         when no transformer exists for (element type, destination)
     */
    common::Result<MappedSequence<std::any>> map_all(const ErasedSequence& sequence,
                                                     const std::type_info& destination);

    template<typename D>
    common::Result<MappedSequence<D>> map_all(const ErasedSequence& sequence) {
        auto erased = map_all(sequence, typeid(D));
        if (erased.is_error()) {
            return erased.error();
        }
        return MappedSequence<D>(
            [inner = std::move(erased).value()]() -> std::optional<common::Result<D>> {
                auto next = inner.next();
                if (!next) {
                    return std::nullopt;
                }
                return detail::unerase<D>(std::move(*next));
            });
    }

    // ========================================================================
    // INTROSPECTION
    // ========================================================================

    TransformerRegistry& registry() noexcept { return *registry_; }
    const TransformerRegistry& registry() const noexcept { return *registry_; }

    const DispatchCacheStats& single_dispatch_stats() const noexcept {
        return single_dispatch_.stats();
    }

    const DispatchCacheStats& collection_dispatch_stats() const noexcept {
        return collection_dispatch_.stats();
    }

    size_t dispatch_cache_size() const { return single_dispatch_.size(); }
    size_t collection_cache_size() const { return collection_dispatch_.size(); }

    const MapperConfig& config() const noexcept { return config_; }

private:
    ErasedInvoker build_single_invoker(const TypePairKey& key) const;
    CollectionInvoker build_collection_invoker(const TypePairKey& key) const;

    std::shared_ptr<TransformerRegistry> registry_;
    MapperConfig config_;

    DispatchCache<ErasedInvoker> single_dispatch_;
    DispatchCache<CollectionInvoker> collection_dispatch_;
};

// ============================================================================
// BUILDER
// ============================================================================

/**
 * @brief Assembles a registry and a Mapper from registrations
 *
 * Everything added is registered as one batch by build(). Without an explicit
 * provider, the mapper falls back to an empty TransformerCatalog (see
 * catalog()) so transformers can still be supplied after build().
 */
class MapperBuilder {
public:
    MapperBuilder() = default;

    MapperBuilder& with_config(MapperConfig config);

    MapperBuilder& with_provider(std::shared_ptr<ITransformerProvider> provider);

    MapperBuilder& add(TransformerRegistration registration);

    template<typename T>
    MapperBuilder& add(std::string implementation = {}) {
        return add(registration_for<T>(std::move(implementation)));
    }

    MapperBuilder& add_all(const RegistrationBatch& batch);

    /**
     * @return MAPPER_CONFLICT (or another register_batch error) if the added
     *         registrations are not a valid batch
     */
    common::Result<std::unique_ptr<Mapper>> build();

    /**
     * @brief Catalog wired as provider by the last build()
     * @return nullptr before build() or when a provider was given explicitly
     */
    const std::shared_ptr<TransformerCatalog>& catalog() const noexcept { return catalog_; }

    size_t pending() const noexcept { return batch_.size(); }

private:
    MapperConfig config_;
    std::shared_ptr<ITransformerProvider> provider_;
    std::shared_ptr<TransformerCatalog> catalog_;
    RegistrationBatch batch_;
};

}  // namespace mapr::core

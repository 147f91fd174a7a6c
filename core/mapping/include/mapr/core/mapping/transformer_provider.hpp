#pragma once

/**
 * @file transformer_provider.hpp
 * @brief Boundary to the container that instantiates transformers
 *
 * The registry asks a provider for a transformer the first time a type pair
 * is resolved. A provider returning nullptr means "nothing available"; the
 * registry does not distinguish why.
 */

#include <mapr/common/platform.hpp>
#include <mapr/core/mapping/registration.hpp>
#include <mapr/core/mapping/transformer.hpp>
#include <mapr/core/mapping/type_pair_key.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mapr::core {

/**
 * @brief Source of transformer instances
 */
class ITransformerProvider {
public:
    virtual ~ITransformerProvider() = default;

    /**
     * @brief Produce the transformer for @p key
     * @return nullptr if no transformer is available
     *
     * May be called concurrently and more than once for the same key.
     */
    virtual std::shared_ptr<const ITransformer> provide(const TypePairKey& key) = 0;
};

/**
 * @brief Instance lifetime inside a TransformerCatalog
 */
enum class ServiceLifetime : uint8_t {
    SINGLETON = 0,  // One instance, created on first provide()
    TRANSIENT = 1,  // New instance on every provide()
};

/**
 * @brief Statistics for catalog monitoring
 */
struct CatalogStats {
    std::atomic<uint64_t> provides{0};
    std::atomic<uint64_t> instances_created{0};
    std::atomic<uint64_t> misses{0};

    void reset() noexcept {
        provides.store(0);
        instances_created.store(0);
        misses.store(0);
    }
};

/**
 * @brief Simple in-memory transformer container
 *
 * Holds at most one registration per key; the first add() for a key wins
 * and later ones are ignored.
 *
 * Thread Safety:
 * - All methods are safe to call concurrently
 * - Factories run outside the catalog lock
 */
class TransformerCatalog : public ITransformerProvider {
public:
    TransformerCatalog() = default;
    ~TransformerCatalog() override = default;

    TransformerCatalog(const TransformerCatalog&)            = delete;
    TransformerCatalog& operator=(const TransformerCatalog&) = delete;

    /**
     * @brief Add a registration
     * @return false if the key was already present
     */
    bool add(TransformerRegistration registration,
             ServiceLifetime lifetime = ServiceLifetime::SINGLETON);

    /**
     * @brief Add every registration of a batch
     * @return Number of registrations actually added
     */
    size_t add_all(const RegistrationBatch& batch,
                   ServiceLifetime lifetime = ServiceLifetime::SINGLETON);

    bool remove(const TypePairKey& key);

    bool contains(const TypePairKey& key) const;

    size_t size() const;

    void clear();

    std::optional<std::string> implementation_name(const TypePairKey& key) const;

    std::shared_ptr<const ITransformer> provide(const TypePairKey& key) override;

    const CatalogStats& stats() const noexcept { return stats_; }

private:
    struct Entry {
        TransformerRegistration registration;
        ServiceLifetime lifetime;
        std::shared_ptr<const ITransformer> singleton;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<TypePairKey, Entry, TypePairKeyHash> entries_;
    CatalogStats stats_;
};

}  // namespace mapr::core

#pragma once

/**
 * @file transformer_registry.hpp
 * @brief Authoritative store of one transformer per type pair
 *
 * The registry is populated in two ways:
 * 1. register_batch(): validated as a whole, committed only if conflict free
 * 2. resolve(): lazily asks the provider on a miss and keeps the first result
 *
 * Successful resolutions are cached for the registry's lifetime. Failed
 * resolutions are never cached, so a later call retries the provider.
 *
 * Thread Safety:
 * - Lookups take a shared lock; inserts take an exclusive lock
 * - The provider is called outside any lock. Concurrent first resolutions of
 *   one key may each call the provider, but exactly one instance is stored
 *   and every caller receives that stored instance.
 */

#include <mapr/common/error.hpp>
#include <mapr/common/platform.hpp>
#include <mapr/core/mapping/registration.hpp>
#include <mapr/core/mapping/transformer.hpp>
#include <mapr/core/mapping/transformer_provider.hpp>
#include <mapr/core/mapping/type_pair_key.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mapr::core {

/**
 * @brief Statistics for registry monitoring
 */
struct RegistryStats {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> provider_calls{0};
    std::atomic<uint64_t> not_found{0};
    std::atomic<uint64_t> race_losses{0};
    std::atomic<uint64_t> batches_committed{0};
    std::atomic<uint64_t> batches_rejected{0};

    double hit_rate() const noexcept {
        auto total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / total * 100.0 : 0.0;
    }

    void reset() noexcept {
        hits.store(0);
        misses.store(0);
        provider_calls.store(0);
        not_found.store(0);
        race_losses.store(0);
        batches_committed.store(0);
        batches_rejected.store(0);
    }
};

class TransformerRegistry {
public:
    /**
     * @param provider Consulted on resolve() misses; may be null
     */
    explicit TransformerRegistry(std::shared_ptr<ITransformerProvider> provider = nullptr);
    ~TransformerRegistry();

    TransformerRegistry(const TransformerRegistry&)            = delete;
    TransformerRegistry& operator=(const TransformerRegistry&) = delete;

    /**
     * @brief Register a batch of transformers
     *
     * The whole batch is validated before anything is stored:
     * - INVALID_ARGUMENT: a registration has no factory, or its factory
     *   produced no instance
     * - MAPPER_CONFLICT: two or more registrations share a key; the message
     *   names every conflicting pair and all implementations involved
     * - CONFIG_INVALID: an instance reports a key other than its registration
     *
     * Keys already stored by an earlier batch or resolution keep their
     * existing instance.
     */
    common::Result<void> register_batch(const RegistrationBatch& batch);

    /**
     * @brief Get the transformer for @p key
     * @return MAPPER_NOT_FOUND ("No mapper registered for S -> D") if neither
     *         the registry nor the provider has one
     */
    common::Result<std::shared_ptr<const ITransformer>> resolve(const TypePairKey& key);

    template<typename S, typename D>
    common::Result<std::shared_ptr<const Transformer<S, D>>> resolve() {
        auto resolved = resolve(TypePairKey::of<S, D>());
        if (resolved.is_error()) {
            return resolved.error();
        }
        auto typed = std::dynamic_pointer_cast<const Transformer<S, D>>(resolved.value());
        if (!typed) {
            return common::err<std::shared_ptr<const Transformer<S, D>>>(
                common::ErrorCode::TYPE_MISMATCH,
                resolved.value()->name() + " does not derive from Transformer<" +
                    TypePairKey::of<S, D>().source_name() + ", " +
                    TypePairKey::of<S, D>().destination_name() + ">");
        }
        return typed;
    }

    /**
     * @brief Check if a transformer is stored (does not consult the provider)
     */
    bool contains(const TypePairKey& key) const;

    size_t size() const;

    /**
     * @brief Drop every stored transformer
     */
    void clear();

    const std::shared_ptr<ITransformerProvider>& provider() const noexcept { return provider_; }

    const RegistryStats& stats() const noexcept { return stats_; }

    void reset_stats() noexcept { stats_.reset(); }

private:
    std::shared_ptr<ITransformerProvider> provider_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<TypePairKey, std::shared_ptr<const ITransformer>, TypePairKeyHash>
        transformers_;

    mutable RegistryStats stats_;
};

/**
 * @brief Message used for every MAPPER_NOT_FOUND error
 */
MAPR_API std::string not_found_message(const TypePairKey& key);

}  // namespace mapr::core

#include <mapr/common/debug.hpp>
#include <mapr/core/mapping/transformer_provider.hpp>

#include <mutex>

namespace mapr::core {

using namespace common;
using namespace common::debug;

namespace {
constexpr const char* LOG_CAT = "registry";
}  // namespace

bool TransformerCatalog::add(TransformerRegistration registration, ServiceLifetime lifetime) {
    std::unique_lock lock(mutex_);
    auto key = registration.key;
    auto [it, inserted] =
        entries_.try_emplace(key, Entry{std::move(registration), lifetime, nullptr});
    if (!inserted) {
        MAPR_LOG_DEBUG(LOG_CAT, "Catalog already holds " << it->second.registration.implementation
                                                         << " for " << key << ", ignoring");
    }
    return inserted;
}

size_t TransformerCatalog::add_all(const RegistrationBatch& batch, ServiceLifetime lifetime) {
    size_t added = 0;
    for (const auto& registration : batch) {
        if (add(registration, lifetime)) {
            ++added;
        }
    }
    return added;
}

bool TransformerCatalog::remove(const TypePairKey& key) {
    std::unique_lock lock(mutex_);
    return entries_.erase(key) > 0;
}

bool TransformerCatalog::contains(const TypePairKey& key) const {
    std::shared_lock lock(mutex_);
    return entries_.find(key) != entries_.end();
}

size_t TransformerCatalog::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void TransformerCatalog::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::optional<std::string> TransformerCatalog::implementation_name(const TypePairKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.registration.implementation;
}

std::shared_ptr<const ITransformer> TransformerCatalog::provide(const TypePairKey& key) {
    stats_.provides.fetch_add(1, std::memory_order_relaxed);

    TransformerFactory factory;
    ServiceLifetime lifetime;
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            stats_.misses.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        if (it->second.singleton) {
            return it->second.singleton;
        }
        factory  = it->second.registration.factory;
        lifetime = it->second.lifetime;
    }

    if (!factory) {
        return nullptr;
    }

    auto instance = factory();
    if (!instance) {
        MAPR_LOG_WARN(LOG_CAT, "Factory for " << key << " produced no instance");
        return nullptr;
    }
    stats_.instances_created.fetch_add(1, std::memory_order_relaxed);

    if (lifetime == ServiceLifetime::TRANSIENT) {
        return instance;
    }

    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        // Removed while the factory ran
        return instance;
    }
    if (!it->second.singleton) {
        it->second.singleton = std::move(instance);
    }
    return it->second.singleton;
}

}  // namespace mapr::core

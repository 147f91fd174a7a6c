#include <mapr/common/debug.hpp>
#include <mapr/core/mapping/transformer_registry.hpp>

#include <mutex>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace mapr::core {

using namespace common;
using namespace common::debug;

namespace {
constexpr const char* LOG_CAT = "registry";

struct KeyGroup {
    TypePairKey key;
    std::vector<const TransformerRegistration*> registrations;
};

std::string conflict_line(const KeyGroup& group) {
    std::ostringstream oss;
    oss << group.key << ": ";
    for (size_t i = 0; i < group.registrations.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << group.registrations[i]->implementation;
    }
    return oss.str();
}

}  // namespace

std::string not_found_message(const TypePairKey& key) {
    return "No mapper registered for " + key.to_string();
}

TransformerRegistry::TransformerRegistry(std::shared_ptr<ITransformerProvider> provider)
    : provider_(std::move(provider)) {}

TransformerRegistry::~TransformerRegistry() = default;

// ============================================================================
// Batch Registration
// ============================================================================

Result<void> TransformerRegistry::register_batch(const RegistrationBatch& batch) {
    // Group by key, preserving first-appearance order
    std::vector<KeyGroup> groups;
    std::unordered_map<TypePairKey, size_t, TypePairKeyHash> group_index;
    std::vector<const TransformerRegistration*> missing_factories;
    for (const auto& registration : batch) {
        if (!registration.factory) {
            missing_factories.push_back(&registration);
        }
        auto [it, inserted] = group_index.try_emplace(registration.key, groups.size());
        if (inserted) {
            groups.push_back(KeyGroup{registration.key, {}});
        }
        groups[it->second].registrations.push_back(&registration);
    }

    std::vector<const KeyGroup*> conflicts;
    for (const auto& group : groups) {
        if (group.registrations.size() > 1) {
            conflicts.push_back(&group);
        }
    }

    std::optional<Error> factory_error;
    if (!missing_factories.empty()) {
        std::ostringstream message;
        for (size_t i = 0; i < missing_factories.size(); ++i) {
            if (i > 0) {
                message << '\n';
            }
            message << "Registration " << missing_factories[i]->implementation << " for "
                    << missing_factories[i]->key << " has no factory";
        }
        factory_error.emplace(ErrorCode::INVALID_ARGUMENT, message.str(), MAPR_CURRENT_LOCATION);
        for (const auto* registration : missing_factories) {
            factory_error->with_context(registration->implementation,
                                        registration->key.to_string());
        }
    }

    if (!conflicts.empty()) {
        std::ostringstream message;
        message << "Multiple mappers found for the same source/destination pairs:\n";
        for (const auto* group : conflicts) {
            message << conflict_line(*group) << '\n';
        }
        message << "Only one mapper per source/destination pair is allowed.";

        Error error(ErrorCode::MAPPER_CONFLICT, message.str(), MAPR_CURRENT_LOCATION);
        for (const auto* group : conflicts) {
            error.with_context(group->key.to_string(), conflict_line(*group));
        }
        // Factory problems travel with the conflict
        if (factory_error) {
            error.with_cause(std::move(*factory_error));
        }

        stats_.batches_rejected.fetch_add(1, std::memory_order_relaxed);
        MAPR_LOG_ERROR(LOG_CAT, "Rejected registration batch with " << conflicts.size()
                                                                    << " conflicting pair(s)");
        return error;
    }

    if (factory_error) {
        stats_.batches_rejected.fetch_add(1, std::memory_order_relaxed);
        MAPR_LOG_ERROR(LOG_CAT, "Rejected registration batch with " << missing_factories.size()
                                                                    << " registration(s) lacking a factory");
        return std::move(*factory_error);
    }

    // Instantiate everything before committing anything
    std::vector<std::pair<const KeyGroup*, std::shared_ptr<const ITransformer>>> staged;
    staged.reserve(groups.size());
    for (const auto& group : groups) {
        const auto& registration = *group.registrations.front();
        auto instance            = registration.factory();
        if (!instance) {
            stats_.batches_rejected.fetch_add(1, std::memory_order_relaxed);
            return err(ErrorCode::INVALID_ARGUMENT, "Factory of " + registration.implementation +
                                                        " for " + group.key.to_string() +
                                                        " produced no instance");
        }
        if (instance->key() != group.key) {
            stats_.batches_rejected.fetch_add(1, std::memory_order_relaxed);
            return err(ErrorCode::CONFIG_INVALID,
                       registration.implementation + " is registered for " +
                           group.key.to_string() + " but handles " + instance->key().to_string());
        }
        staged.emplace_back(&group, std::move(instance));
    }

    size_t added = 0;
    {
        std::unique_lock lock(mutex_);
        for (auto& [group, instance] : staged) {
            auto [it, inserted] = transformers_.try_emplace(group->key, std::move(instance));
            if (inserted) {
                ++added;
            } else {
                MAPR_LOG_DEBUG(LOG_CAT, "Keeping existing " << it->second->name() << " for "
                                                            << group->key << ", ignoring "
                                                            << group->registrations.front()
                                                                   ->implementation);
            }
        }
    }

    stats_.batches_committed.fetch_add(1, std::memory_order_relaxed);
    MAPR_LOG_INFO(LOG_CAT, "Registered " << added << " of " << staged.size() << " transformer(s)");
    return ok();
}

// ============================================================================
// Resolution
// ============================================================================

Result<std::shared_ptr<const ITransformer>> TransformerRegistry::resolve(const TypePairKey& key) {
    // Fast path: shared lock
    {
        std::shared_lock lock(mutex_);
        auto it = transformers_.find(key);
        if (MAPR_LIKELY(it != transformers_.end())) {
            stats_.hits.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    stats_.misses.fetch_add(1, std::memory_order_relaxed);

    // Slow path: ask the provider without holding the lock
    std::shared_ptr<const ITransformer> instance;
    if (provider_) {
        stats_.provider_calls.fetch_add(1, std::memory_order_relaxed);
        instance = provider_->provide(key);
    }

    if (!instance) {
        stats_.not_found.fetch_add(1, std::memory_order_relaxed);
        MAPR_LOG_DEBUG(LOG_CAT, "No transformer available for " << key);
        return err<std::shared_ptr<const ITransformer>>(ErrorCode::MAPPER_NOT_FOUND,
                                                        not_found_message(key));
    }

    if (instance->key() != key) {
        return err<std::shared_ptr<const ITransformer>>(
            ErrorCode::TYPE_MISMATCH, "Provider returned " + instance->name() + " handling " +
                                          instance->key().to_string() + " for " + key.to_string());
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = transformers_.try_emplace(key, std::move(instance));
    if (inserted) {
        MAPR_LOG_DEBUG(LOG_CAT, "Resolved " << it->second->name() << " for " << key);
    } else {
        stats_.race_losses.fetch_add(1, std::memory_order_relaxed);
    }
    return it->second;
}

bool TransformerRegistry::contains(const TypePairKey& key) const {
    std::shared_lock lock(mutex_);
    return transformers_.find(key) != transformers_.end();
}

size_t TransformerRegistry::size() const {
    std::shared_lock lock(mutex_);
    return transformers_.size();
}

void TransformerRegistry::clear() {
    std::unique_lock lock(mutex_);
    transformers_.clear();
    MAPR_LOG_DEBUG(LOG_CAT, "Registry cleared");
}

}  // namespace mapr::core

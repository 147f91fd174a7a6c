#include <mapr/common/debug.hpp>
#include <mapr/core/mapping/mapper.hpp>

#include <utility>

namespace mapr::core {

using namespace common;
using namespace common::debug;

namespace {
constexpr const char* LOG_CAT = "mapping";
}  // namespace

// ============================================================================
// Mapper
// ============================================================================

Mapper::Mapper(std::shared_ptr<TransformerRegistry> registry, MapperConfig config)
    : registry_(registry ? std::move(registry) : std::make_shared<TransformerRegistry>()),
      config_(config),
      single_dispatch_(config.dispatch_cache),
      collection_dispatch_(config.dispatch_cache) {
    MAPR_LOG_DEBUG(LOG_CAT, "Mapper created (dispatch cache ceiling "
                                << config_.dispatch_cache.max_entries << ")");
}

Mapper::~Mapper() = default;

Result<std::any> Mapper::map(const std::any& source, const std::type_info& destination) {
    if (!source.has_value()) {
        return err<std::any>(ErrorCode::INVALID_ARGUMENT, "Source object must not be null");
    }

    TypePairKey key(source.type(), destination);
    auto invoker = single_dispatch_.get_or_create(
        key, [this](const TypePairKey& k) { return build_single_invoker(k); });
    return invoker(source);
}

Result<MappedSequence<std::any>> Mapper::map_all(const ErasedSequence& sequence,
                                                 const std::type_info& destination) {
    auto inference = CollectionInferencer::infer(sequence);
    if (inference.is_error()) {
        return inference.error();
    }

    auto& inferred = inference.value();
    MAPR_LOG_TRACE(LOG_CAT, "Element type " << short_type_name(*inferred.element_type)
                                            << " taken from "
                                            << source_name(inferred.source));

    TypePairKey key(*inferred.element_type, destination);
    auto invoker = collection_dispatch_.get_or_create(
        key, [this](const TypePairKey& k) { return build_collection_invoker(k); });
    return invoker(std::move(inferred.cursor));
}

ErasedInvoker Mapper::build_single_invoker(const TypePairKey& key) const {
    // Resolution happens per call; a missing transformer must not be cached
    return [registry = registry_.get(), key](const std::any& source) -> Result<std::any> {
        auto transformer = registry->resolve(key);
        if (transformer.is_error()) {
            return transformer.error();
        }
        return transformer.value()->transform_erased(source);
    };
}

CollectionInvoker Mapper::build_collection_invoker(const TypePairKey& key) const {
    return [registry = registry_.get(),
            key](std::shared_ptr<ErasedCursor> cursor) -> Result<MappedSequence<std::any>> {
        auto resolved = registry->resolve(key);
        if (resolved.is_error()) {
            return resolved.error();
        }

        auto transformer = std::move(resolved).value();
        return MappedSequence<std::any>(
            [transformer = std::move(transformer),
             cursor      = std::move(cursor)]() -> std::optional<Result<std::any>> {
                std::any element;
                while (cursor->next(element)) {
                    if (element.has_value()) {
                        return transformer->transform_erased(element);
                    }
                }
                return std::nullopt;
            });
    };
}

// ============================================================================
// MapperBuilder
// ============================================================================

MapperBuilder& MapperBuilder::with_config(MapperConfig config) {
    config_ = config;
    return *this;
}

MapperBuilder& MapperBuilder::with_provider(std::shared_ptr<ITransformerProvider> provider) {
    provider_ = std::move(provider);
    return *this;
}

MapperBuilder& MapperBuilder::add(TransformerRegistration registration) {
    batch_.push_back(std::move(registration));
    return *this;
}

MapperBuilder& MapperBuilder::add_all(const RegistrationBatch& batch) {
    batch_.insert(batch_.end(), batch.begin(), batch.end());
    return *this;
}

Result<std::unique_ptr<Mapper>> MapperBuilder::build() {
    std::shared_ptr<ITransformerProvider> provider = provider_;
    catalog_.reset();
    if (!provider) {
        catalog_ = std::make_shared<TransformerCatalog>();
        provider = catalog_;
    }

    auto registry = std::make_shared<TransformerRegistry>(std::move(provider));
    auto registered = registry->register_batch(batch_);
    if (registered.is_error()) {
        catalog_.reset();
        return registered.error();
    }

    MAPR_LOG_INFO(LOG_CAT, "Mapper built with " << registry->size() << " transformer(s)");
    return std::make_unique<Mapper>(std::move(registry), config_);
}

}  // namespace mapr::core

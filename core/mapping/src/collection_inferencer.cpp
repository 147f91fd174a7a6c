#include <mapr/common/debug.hpp>
#include <mapr/common/type_name.hpp>
#include <mapr/core/mapping/collection_inferencer.hpp>

#include <utility>

namespace mapr::core {

using namespace common;
using namespace common::debug;

namespace {
constexpr const char* LOG_CAT = "mapping";

/**
 * Replays an element already pulled during inference, then forwards to the
 * underlying cursor.
 */
class PrimedCursor final : public ErasedCursor {
public:
    PrimedCursor(std::unique_ptr<ErasedCursor> inner, std::any first)
        : inner_(std::move(inner)), first_(std::move(first)) {}

    bool next(std::any& out) override {
        if (primed_) {
            primed_ = false;
            out     = std::move(first_);
            first_.reset();
            return true;
        }
        return inner_->next(out);
    }

private:
    std::unique_ptr<ErasedCursor> inner_;
    std::any first_;
    bool primed_ = true;
};

std::string range_label(const ErasedSequence& sequence) {
    return sequence.range_type() ? short_type_name(*sequence.range_type()) : "collection";
}

}  // namespace

Result<ElementTypeInference> CollectionInferencer::infer(const ErasedSequence& sequence) {
    if (!sequence.is_present()) {
        return err<ElementTypeInference>(ErrorCode::INVALID_ARGUMENT,
                                         "Source collection must not be null");
    }

    if (const auto* type = sequence.reified_element_type()) {
        return ElementTypeInference{type, ElementTypeSource::REIFIED_PARAMETER, sequence.open()};
    }

    if (const auto* type = sequence.capability_element_type()) {
        return ElementTypeInference{type, ElementTypeSource::SEQUENCE_CAPABILITY, sequence.open()};
    }

    auto cursor = sequence.open();
    std::any element;
    size_t skipped = 0;
    while (cursor->next(element)) {
        if (element.has_value()) {
            const auto& type = element.type();
            MAPR_LOG_TRACE(LOG_CAT, "Inferred element type " << short_type_name(type) << " of "
                                                             << range_label(sequence)
                                                             << " after skipping " << skipped
                                                             << " absent element(s)");
            return ElementTypeInference{
                &type, ElementTypeSource::FIRST_ELEMENT,
                std::make_shared<PrimedCursor>(std::move(cursor), std::move(element))};
        }
        ++skipped;
    }

    return err<ElementTypeInference>(
        ErrorCode::TYPE_INFERENCE_FAILED,
        "Cannot determine the element type of " + range_label(sequence) +
            ": it carries no element type and holds no non-null element");
}

}  // namespace mapr::core

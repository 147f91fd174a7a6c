#pragma once

/**
 * @file collection_inferencer.hpp
 * @brief Element-type inference for type-erased collections
 *
 * Strategies, tried in order:
 * 1. REIFIED_PARAMETER:   the range is C<E, ...> and E is its element type
 * 2. SEQUENCE_CAPABILITY: the range's iterator yields a known element type
 * 3. FIRST_ELEMENT:       runtime type of the first non-absent element
 *
 * The static strategies never touch the elements, so they also work on empty
 * ranges. The scan strategy consumes the start of the range's single pass;
 * the returned cursor replays the scanned element and continues from there,
 * so the input is still read exactly once.
 */

#include <mapr/common/error.hpp>
#include <mapr/core/mapping/erased_sequence.hpp>

#include <cstdint>
#include <memory>
#include <string_view>
#include <typeinfo>

namespace mapr::core {

enum class ElementTypeSource : uint8_t {
    REIFIED_PARAMETER   = 0,
    SEQUENCE_CAPABILITY = 1,
    FIRST_ELEMENT       = 2,
};

constexpr std::string_view source_name(ElementTypeSource source) noexcept {
    switch (source) {
        case ElementTypeSource::REIFIED_PARAMETER:
            return "reified parameter";
        case ElementTypeSource::SEQUENCE_CAPABILITY:
            return "sequence capability";
        case ElementTypeSource::FIRST_ELEMENT:
            return "first element";
        default:
            return "unknown";
    }
}

struct ElementTypeInference {
    const std::type_info* element_type = nullptr;
    ElementTypeSource source           = ElementTypeSource::REIFIED_PARAMETER;

    /// Cursor positioned at the first element of the (single) pass
    std::shared_ptr<ErasedCursor> cursor;
};

class CollectionInferencer {
public:
    /**
     * @brief Infer the element type of @p sequence
     *
     * @return INVALID_ARGUMENT for an absent sequence;
     *         TYPE_INFERENCE_FAILED when no strategy applies
     */
    static common::Result<ElementTypeInference> infer(const ErasedSequence& sequence);
};

}  // namespace mapr::core

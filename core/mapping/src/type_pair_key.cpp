#include <mapr/common/type_name.hpp>
#include <mapr/core/mapping/type_pair_key.hpp>

namespace mapr::core {

using namespace common;

Result<TypePairKey> TypePairKey::create(const std::type_info* source,
                                        const std::type_info* destination) {
    if (source == nullptr) {
        return err<TypePairKey>(ErrorCode::INVALID_ARGUMENT, "Source type must not be null");
    }
    if (destination == nullptr) {
        return err<TypePairKey>(ErrorCode::INVALID_ARGUMENT, "Destination type must not be null");
    }
    return ok(TypePairKey(*source, *destination));
}

std::string TypePairKey::source_name() const {
    return short_type_name(*source_);
}

std::string TypePairKey::destination_name() const {
    return short_type_name(*destination_);
}

std::string TypePairKey::to_string() const {
    return source_name() + " -> " + destination_name();
}

}  // namespace mapr::core

#pragma once

/**
 * @file type_pair_key.hpp
 * @brief Identity of an ordered (source type, destination type) pair
 *
 * TypePairKey is the sole key type of both the transformer registry and the
 * dispatch caches. Keys are small immutable values with a precomputed hash,
 * so creating one per lookup costs a couple of loads and a hash combine.
 */

#include <mapr/common/error.hpp>

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace mapr::core {

class TypePairKey {
public:
    /**
     * @brief Build a key from possibly-absent type identities
     * @return INVALID_ARGUMENT if either identity is null
     */
    static common::Result<TypePairKey> create(const std::type_info* source,
                                              const std::type_info* destination);

    template<typename S, typename D>
    static TypePairKey of() noexcept {
        return TypePairKey(typeid(S), typeid(D));
    }

    TypePairKey(const std::type_info& source, const std::type_info& destination) noexcept
        : source_(&source)
        , destination_(&destination)
        , hash_(combine(std::type_index(source).hash_code(),
                        std::type_index(destination).hash_code())) {}

    std::type_index source_type() const noexcept { return std::type_index(*source_); }
    std::type_index destination_type() const noexcept { return std::type_index(*destination_); }

    const std::type_info& source_info() const noexcept { return *source_; }
    const std::type_info& destination_info() const noexcept { return *destination_; }

    size_t hash() const noexcept { return hash_; }

    /// Short human-readable names, e.g. "User"
    std::string source_name() const;
    std::string destination_name() const;

    /// "{source} -> {destination}"
    std::string to_string() const;

    bool operator==(const TypePairKey& other) const noexcept {
        return hash_ == other.hash_ && *source_ == *other.source_ &&
               *destination_ == *other.destination_;
    }

    bool operator!=(const TypePairKey& other) const noexcept { return !(*this == other); }

private:
    static constexpr size_t combine(size_t a, size_t b) noexcept {
        // boost::hash_combine
        return a ^ (b + 0x9e3779b9 + (a << 6) + (a >> 2));
    }

    const std::type_info* source_;
    const std::type_info* destination_;
    size_t hash_;
};

struct TypePairKeyHash {
    size_t operator()(const TypePairKey& key) const noexcept { return key.hash(); }
};

inline std::ostream& operator<<(std::ostream& os, const TypePairKey& key) {
    return os << key.to_string();
}

}  // namespace mapr::core

template<>
struct std::hash<mapr::core::TypePairKey> {
    size_t operator()(const mapr::core::TypePairKey& key) const noexcept { return key.hash(); }
};

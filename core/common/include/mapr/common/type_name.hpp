#pragma once

/**
 * @file type_name.hpp
 * @brief Human-readable names for runtime type identities
 *
 * Names are used in diagnostics only (error messages, logs). They are never
 * used for identity comparison; std::type_index is the identity.
 */

#include <string>
#include <string_view>
#include <typeinfo>

#include "platform.hpp"

namespace mapr::common {

/**
 * @brief Demangle an ABI symbol name
 * @return The input unchanged when demangling is unavailable or fails
 */
MAPR_API std::string demangle(const char* mangled);

/**
 * @brief Fully qualified name, e.g. "app::model::User"
 */
MAPR_API std::string type_name(const std::type_info& type);

/**
 * @brief Name without namespace qualifiers, e.g. "User" or "vector<User>"
 *
 * Every identifier inside template arguments is stripped too.
 */
MAPR_API std::string short_type_name(const std::type_info& type);

/**
 * @brief Strip namespace qualifiers from an already demangled name
 */
MAPR_API std::string strip_namespaces(std::string_view qualified);

template<typename T>
std::string type_name() {
    return type_name(typeid(T));
}

template<typename T>
std::string short_type_name() {
    return short_type_name(typeid(T));
}

}  // namespace mapr::common

#pragma once

/**
 * @file config_types.hpp
 * @brief Configuration types for mapr
 *
 * All types loaded from YAML (default) or JSON by ConfigLoader.
 */

#include <mapr/core/mapping/mapper.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace mapr::core::config {

// ============================================================================
// FORMAT
// ============================================================================

/**
 * @brief Supported configuration file formats
 */
enum class ConfigFormat : uint8_t {
    AUTO,   ///< Auto-detect from file extension or content
    YAML,   ///< YAML format (default)
    JSON    ///< JSON format
};

// ============================================================================
// LOGGING CONFIGURATION
// ============================================================================

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";     ///< trace, debug, info, warn, error, fatal, off
    std::string output = "console"; ///< console, file, none
    std::string file_path;
    uint32_t max_file_size_mb = 10;
    uint32_t max_files = 5;
    bool include_timestamp = true;
    bool include_thread_id = false;

    /// Per-category level overrides (category -> level name)
    std::map<std::string, std::string> categories;
};

// ============================================================================
// SETTINGS
// ============================================================================

/**
 * @brief Complete mapr settings document
 */
struct MapperSettings {
    MapperConfig mapper;
    LoggingConfig logging;
};

}  // namespace mapr::core::config

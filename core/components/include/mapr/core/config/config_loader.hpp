#pragma once

/**
 * @file config_loader.hpp
 * @brief Configuration loader for mapr
 *
 * Loads MapperSettings from YAML (default) or JSON files or strings.
 *
 * @code
 * auto loader   = mapr::core::config::create_config_loader();
 * auto settings = loader->load_settings("mapr.yaml");
 * if (settings) {
 *     apply_logging_config(settings.value().logging);
 *     builder.with_config(settings.value().mapper);
 * }
 * @endcode
 */

#include <mapr/common/error.hpp>
#include <mapr/core/config/config_types.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace mapr::core::config {

/**
 * @brief Configuration loader interface
 */
class ConfigLoader {
public:
    virtual ~ConfigLoader() = default;

    // ========================================================================
    // FORMAT DETECTION
    // ========================================================================

    /**
     * @brief Detect format from file extension
     * @return JSON for .json, YAML otherwise
     */
    static ConfigFormat detect_format(const std::filesystem::path& path);

    /**
     * @brief Detect format from content
     * @return JSON if the first non-blank character opens an object or array
     */
    static ConfigFormat detect_format_from_content(std::string_view content);

    // ========================================================================
    // LOADING
    // ========================================================================

    /**
     * @brief Load settings from file
     * @param path Path to configuration file
     * @param format Format override (AUTO to detect from extension)
     * @return Validated settings, CONFIG_FILE_NOT_FOUND, CONFIG_PARSE_ERROR,
     *         CONFIG_TYPE_MISMATCH or a validation error
     */
    virtual common::Result<MapperSettings> load_settings(
        const std::filesystem::path& path, ConfigFormat format = ConfigFormat::AUTO) = 0;

    /**
     * @brief Parse settings from a string
     * @param format Format override (AUTO to detect from content)
     */
    virtual common::Result<MapperSettings> parse_settings(
        std::string_view content, ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // SERIALIZATION
    // ========================================================================

    virtual common::Result<std::string> serialize_settings(
        const MapperSettings& settings, ConfigFormat format = ConfigFormat::YAML) = 0;

    /**
     * @brief Save settings to file, creating parent directories as needed
     * @param format Format override (AUTO to detect from extension)
     */
    virtual common::Result<void> save_settings(const MapperSettings& settings,
                                               const std::filesystem::path& path,
                                               ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // VALIDATION
    // ========================================================================

    /**
     * @brief Validate settings
     *
     * - CONFIG_VALUE_OUT_OF_RANGE: dispatch_cache.max_entries < 1
     * - CONFIG_INVALID_VALUE: unknown level name or output kind
     * - CONFIG_MISSING: `output: file` without file_path
     */
    virtual common::Result<void> validate(const MapperSettings& settings) = 0;
};

/**
 * @brief Configuration loader implementation
 */
class ConfigLoaderImpl : public ConfigLoader {
public:
    ConfigLoaderImpl()           = default;
    ~ConfigLoaderImpl() override = default;

    common::Result<MapperSettings> load_settings(
        const std::filesystem::path& path, ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<MapperSettings> parse_settings(
        std::string_view content, ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<std::string> serialize_settings(
        const MapperSettings& settings, ConfigFormat format = ConfigFormat::YAML) override;

    common::Result<void> save_settings(const MapperSettings& settings,
                                       const std::filesystem::path& path,
                                       ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<void> validate(const MapperSettings& settings) override;

private:
    common::Result<std::string> read_file(const std::filesystem::path& path);
    common::Result<void> write_file(const std::filesystem::path& path, std::string_view content);
    ConfigFormat resolve_format(const std::filesystem::path& path, ConfigFormat format);
};

/**
 * @brief Create a configuration loader instance
 */
std::unique_ptr<ConfigLoader> create_config_loader();

/**
 * @brief Reconfigure the global logger
 *
 * Replaces every sink according to @p config.output and resets the level
 * filter to @p config.level plus the category overrides.
 *
 * @return CONFIG_INVALID_VALUE for an unknown level or output kind;
 *         FILE_ACCESS_DENIED when the log file cannot be opened
 */
common::Result<void> apply_logging_config(const LoggingConfig& config);

}  // namespace mapr::core::config

/**
 * @file config_loader.cpp
 * @brief Configuration loader implementation
 */

#include <mapr/common/debug.hpp>
#include <mapr/core/config/config_loader.hpp>

#include <yaml-cpp/yaml.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace mapr::core::config {

using namespace common;
using namespace common::debug;

namespace {
constexpr const char* LOG_CAT = "config";
}  // namespace

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<ConfigLoader> create_config_loader() {
    return std::make_unique<ConfigLoaderImpl>();
}

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat ConfigLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;  // .yaml, .yml and anything else
}

ConfigFormat ConfigLoader::detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos < content.size() && (content[pos] == '{' || content[pos] == '[')) {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

// ============================================================================
// YAML PARSING HELPERS
// ============================================================================

namespace {

// Conversion failures propagate as YAML::BadConversion
template<typename T>
T yaml_get(const YAML::Node& node, const std::string& key, T default_value) {
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

size_t to_max_entries(int64_t value) {
    // Out-of-range values are reported by validate()
    return value < 1 ? 0 : static_cast<size_t>(value);
}

MapperConfig parse_mapper_config(const YAML::Node& node) {
    MapperConfig config;
    if (!node) return config;

    if (auto cache = node["dispatch_cache"]) {
        config.dispatch_cache.max_entries = to_max_entries(yaml_get<int64_t>(
            cache, "max_entries", static_cast<int64_t>(config.dispatch_cache.max_entries)));
    }
    return config;
}

LoggingConfig parse_logging_config(const YAML::Node& node) {
    LoggingConfig config;
    if (!node) return config;

    config.level = yaml_get<std::string>(node, "level", config.level);
    config.output = yaml_get<std::string>(node, "output", config.output);
    config.file_path = yaml_get<std::string>(node, "file_path", "");
    config.max_file_size_mb = yaml_get<uint32_t>(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files = yaml_get<uint32_t>(node, "max_files", config.max_files);
    config.include_timestamp = yaml_get(node, "include_timestamp", config.include_timestamp);
    config.include_thread_id = yaml_get(node, "include_thread_id", config.include_thread_id);

    if (node["categories"]) {
        for (const auto& kv : node["categories"]) {
            config.categories[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    return config;
}

MapperSettings parse_settings_from_yaml(const YAML::Node& root) {
    MapperSettings settings;
    settings.mapper = parse_mapper_config(root["mapper"]);
    settings.logging = parse_logging_config(root["logging"]);
    return settings;
}

// ============================================================================
// JSON PARSING HELPERS
// ============================================================================

// Conversion failures propagate as Json::LogicError
template<typename T>
T json_get(const Json::Value& node, const std::string& key, T default_value);

template<>
std::string json_get<std::string>(const Json::Value& node, const std::string& key,
                                  std::string default_value) {
    return node.get(key, default_value).asString();
}

template<>
bool json_get<bool>(const Json::Value& node, const std::string& key, bool default_value) {
    return node.get(key, default_value).asBool();
}

template<>
int64_t json_get<int64_t>(const Json::Value& node, const std::string& key,
                          int64_t default_value) {
    return node.get(key, Json::Int64(default_value)).asInt64();
}

template<>
uint32_t json_get<uint32_t>(const Json::Value& node, const std::string& key,
                            uint32_t default_value) {
    return node.get(key, Json::UInt(default_value)).asUInt();
}

MapperConfig parse_mapper_config_json(const Json::Value& node) {
    MapperConfig config;
    if (!node.isObject()) return config;

    const auto& cache = node["dispatch_cache"];
    if (cache.isObject()) {
        config.dispatch_cache.max_entries = to_max_entries(json_get<int64_t>(
            cache, "max_entries", static_cast<int64_t>(config.dispatch_cache.max_entries)));
    }
    return config;
}

LoggingConfig parse_logging_config_json(const Json::Value& node) {
    LoggingConfig config;
    if (!node.isObject()) return config;

    config.level = json_get<std::string>(node, "level", config.level);
    config.output = json_get<std::string>(node, "output", config.output);
    config.file_path = json_get<std::string>(node, "file_path", "");
    config.max_file_size_mb = json_get<uint32_t>(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files = json_get<uint32_t>(node, "max_files", config.max_files);
    config.include_timestamp = json_get<bool>(node, "include_timestamp", config.include_timestamp);
    config.include_thread_id = json_get<bool>(node, "include_thread_id", config.include_thread_id);

    const auto& categories = node["categories"];
    if (categories.isObject()) {
        for (const auto& name : categories.getMemberNames()) {
            config.categories[name] = categories[name].asString();
        }
    }
    return config;
}

MapperSettings parse_settings_from_json(const Json::Value& root) {
    MapperSettings settings;
    settings.mapper = parse_mapper_config_json(root["mapper"]);
    settings.logging = parse_logging_config_json(root["logging"]);
    return settings;
}

// ============================================================================
// SERIALIZATION HELPERS
// ============================================================================

std::string settings_to_yaml(const MapperSettings& settings) {
    const auto& logging = settings.logging;

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "mapper" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "dispatch_cache" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_entries" << YAML::Value
        << static_cast<uint64_t>(settings.mapper.dispatch_cache.max_entries);
    out << YAML::EndMap << YAML::EndMap;

    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << logging.level;
    out << YAML::Key << "output" << YAML::Value << logging.output;
    out << YAML::Key << "file_path" << YAML::Value << logging.file_path;
    out << YAML::Key << "max_file_size_mb" << YAML::Value << logging.max_file_size_mb;
    out << YAML::Key << "max_files" << YAML::Value << logging.max_files;
    out << YAML::Key << "include_timestamp" << YAML::Value << logging.include_timestamp;
    out << YAML::Key << "include_thread_id" << YAML::Value << logging.include_thread_id;
    if (!logging.categories.empty()) {
        out << YAML::Key << "categories" << YAML::Value << YAML::BeginMap;
        for (const auto& [name, level] : logging.categories) {
            out << YAML::Key << name << YAML::Value << level;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

std::string settings_to_json(const MapperSettings& settings) {
    const auto& logging = settings.logging;

    Json::Value root;
    root["mapper"]["dispatch_cache"]["max_entries"] =
        Json::UInt64(settings.mapper.dispatch_cache.max_entries);

    auto& log = root["logging"];
    log["level"] = logging.level;
    log["output"] = logging.output;
    log["file_path"] = logging.file_path;
    log["max_file_size_mb"] = Json::UInt(logging.max_file_size_mb);
    log["max_files"] = Json::UInt(logging.max_files);
    log["include_timestamp"] = logging.include_timestamp;
    log["include_thread_id"] = logging.include_thread_id;
    for (const auto& [name, level] : logging.categories) {
        log["categories"][name] = level;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root);
}

bool is_known_output(const std::string& output) {
    return output == "console" || output == "file" || output == "none";
}

}  // anonymous namespace

// ============================================================================
// IMPLEMENTATION
// ============================================================================

Result<std::string> ConfigLoaderImpl::read_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return err<std::string>(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                "Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return err<std::string>(ErrorCode::FILE_ACCESS_DENIED,
                                "Failed to open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Result<void> ConfigLoaderImpl::write_file(const std::filesystem::path& path,
                                          std::string_view content) {
    auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result<void>(ErrorCode::OS_ERROR,
                                "Failed to create directory: " + parent.string());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return Result<void>(ErrorCode::FILE_ACCESS_DENIED,
                            "Failed to open file for writing: " + path.string());
    }

    file << content;
    if (!file.good()) {
        return Result<void>(ErrorCode::OS_ERROR, "Failed to write to file: " + path.string());
    }

    return ok();
}

ConfigFormat ConfigLoaderImpl::resolve_format(const std::filesystem::path& path,
                                              ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        return detect_format(path);
    }
    return format;
}

// ============================================================================
// LOADING
// ============================================================================

Result<MapperSettings> ConfigLoaderImpl::load_settings(const std::filesystem::path& path,
                                                       ConfigFormat format) {
    auto content = read_file(path);
    if (!content) {
        MAPR_LOG_WARN(LOG_CAT, content.message());
        return content.error();
    }

    MAPR_LOG_DEBUG(LOG_CAT, "Loading settings from " << path.string());
    return parse_settings(content.value(), resolve_format(path, format));
}

Result<MapperSettings> ConfigLoaderImpl::parse_settings(std::string_view content,
                                                        ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        format = detect_format_from_content(content);
    }

    MapperSettings settings;
    try {
        if (format == ConfigFormat::JSON) {
            Json::Value root;
            Json::CharReaderBuilder builder;
            std::string errors;
            std::istringstream stream{std::string{content}};

            if (!Json::parseFromStream(builder, stream, &root, &errors)) {
                return err<MapperSettings>(ErrorCode::CONFIG_PARSE_ERROR,
                                           "JSON parse error: " + errors);
            }
            settings = parse_settings_from_json(root);
        } else {
            YAML::Node root = YAML::Load(std::string(content));
            settings = parse_settings_from_yaml(root);
        }
    } catch (const YAML::BadConversion& e) {
        return err<MapperSettings>(ErrorCode::CONFIG_TYPE_MISMATCH,
                                   std::string("Type mismatch: ") + e.what());
    } catch (const Json::LogicError& e) {
        return err<MapperSettings>(ErrorCode::CONFIG_TYPE_MISMATCH,
                                   std::string("Type mismatch: ") + e.what());
    } catch (const std::exception& e) {
        return err<MapperSettings>(ErrorCode::CONFIG_PARSE_ERROR,
                                   std::string("Parse error: ") + e.what());
    }

    MAPR_TRY(validate(settings));
    return settings;
}

// ============================================================================
// SERIALIZATION
// ============================================================================

Result<std::string> ConfigLoaderImpl::serialize_settings(const MapperSettings& settings,
                                                         ConfigFormat format) {
    if (format == ConfigFormat::JSON) {
        return settings_to_json(settings);
    }
    return settings_to_yaml(settings);
}

Result<void> ConfigLoaderImpl::save_settings(const MapperSettings& settings,
                                             const std::filesystem::path& path,
                                             ConfigFormat format) {
    auto result = serialize_settings(settings, resolve_format(path, format));
    if (!result) {
        return result.error();
    }

    return write_file(path, result.value());
}

// ============================================================================
// VALIDATION
// ============================================================================

Result<void> ConfigLoaderImpl::validate(const MapperSettings& settings) {
    if (settings.mapper.dispatch_cache.max_entries < 1) {
        return Result<void>(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                            "mapper.dispatch_cache.max_entries must be at least 1");
    }

    const auto& logging = settings.logging;
    if (!try_parse_log_level(logging.level)) {
        return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                            "Unknown log level: " + logging.level);
    }

    for (const auto& [category, level] : logging.categories) {
        if (!try_parse_log_level(level)) {
            return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                                "Unknown log level for category " + category + ": " + level);
        }
    }

    if (!is_known_output(logging.output)) {
        return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                            "Unknown logging output: " + logging.output);
    }

    if (logging.output == "file" && logging.file_path.empty()) {
        return Result<void>(ErrorCode::CONFIG_MISSING,
                            "logging.file_path is required when output is 'file'");
    }

    return ok();
}

// ============================================================================
// LOGGING SETUP
// ============================================================================

Result<void> apply_logging_config(const LoggingConfig& config) {
    auto level = try_parse_log_level(config.level);
    if (!level) {
        return Result<void>(ErrorCode::CONFIG_INVALID_VALUE, "Unknown log level: " + config.level);
    }
    if (!is_known_output(config.output)) {
        return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                            "Unknown logging output: " + config.output);
    }

    std::shared_ptr<ILogSink> sink;
    if (config.output == "console") {
        ConsoleSink::Config console;
        console.include_timestamp = config.include_timestamp;
        console.include_thread_id = config.include_thread_id;
        sink = std::make_shared<ConsoleSink>(console);
    } else if (config.output == "file") {
        FileSink::Config file;
        file.file_path = config.file_path;
        file.max_file_size = static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024;
        file.max_files = config.max_files;
        file.include_thread_id = config.include_thread_id;
        sink = std::make_shared<FileSink>(file);
        if (!sink->is_ready()) {
            return Result<void>(ErrorCode::FILE_ACCESS_DENIED,
                                "Cannot open log file: " + config.file_path);
        }
    }

    auto& logger = Logger::instance();
    auto& filter = logger.filter();

    std::vector<std::pair<std::string, LogLevel>> overrides;
    for (const auto& [category, name] : config.categories) {
        auto category_level = try_parse_log_level(name);
        if (!category_level) {
            return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                                "Unknown log level for category " + category + ": " + name);
        }
        overrides.emplace_back(category, *category_level);
    }

    logger.clear_sinks();
    if (sink) {
        logger.add_sink(std::move(sink));
    }

    filter.reset();
    filter.set_level(*level);
    for (const auto& [category, category_level] : overrides) {
        filter.set_category_level(category, category_level);
    }

    MAPR_LOG_DEBUG(LOG_CAT, "Logging configured: level=" << config.level
                                                         << " output=" << config.output);
    return ok();
}

}  // namespace mapr::core::config

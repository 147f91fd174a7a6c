/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the YAML/JSON settings loader
 */

#include <gtest/gtest.h>
#include <mapr/common/debug.hpp>
#include <mapr/common/platform.hpp>
#include <mapr/core/config/config_loader.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

using namespace mapr::common;
using namespace mapr::core::config;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        loader_   = create_config_loader();
        temp_dir_ = std::filesystem::temp_directory_path() /
                    ("mapr_config_" + std::to_string(platform::get_process_id()));
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        auto& logger = debug::Logger::instance();
        logger.clear_sinks();
        logger.filter().reset();
        logger.add_sink(std::make_shared<debug::ConsoleSink>());

        std::error_code ec;
        std::filesystem::remove_all(temp_dir_, ec);
    }

    void write(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::unique_ptr<ConfigLoader> loader_;
    std::filesystem::path temp_dir_;
};

// ============================================================================
// Format detection
// ============================================================================

TEST_F(ConfigLoaderTest, DetectFormatFromExtension) {
    EXPECT_EQ(ConfigLoader::detect_format("settings.json"), ConfigFormat::JSON);
    EXPECT_EQ(ConfigLoader::detect_format("SETTINGS.JSON"), ConfigFormat::JSON);
    EXPECT_EQ(ConfigLoader::detect_format("settings.yaml"), ConfigFormat::YAML);
    EXPECT_EQ(ConfigLoader::detect_format("settings.yml"), ConfigFormat::YAML);
    EXPECT_EQ(ConfigLoader::detect_format("settings"), ConfigFormat::YAML);
}

TEST_F(ConfigLoaderTest, DetectFormatFromContent) {
    EXPECT_EQ(ConfigLoader::detect_format_from_content("  \n{\"mapper\": {}}"), ConfigFormat::JSON);
    EXPECT_EQ(ConfigLoader::detect_format_from_content("[]"), ConfigFormat::JSON);
    EXPECT_EQ(ConfigLoader::detect_format_from_content("mapper:\n  x: 1"), ConfigFormat::YAML);
    EXPECT_EQ(ConfigLoader::detect_format_from_content(""), ConfigFormat::YAML);
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigLoaderTest, EmptyDocumentGivesDefaults) {
    auto result = loader_->parse_settings("", ConfigFormat::YAML);

    ASSERT_TRUE(result.is_success()) << result.message();
    EXPECT_EQ(result.value().mapper.dispatch_cache.max_entries, 2048u);
    EXPECT_EQ(result.value().logging.level, "info");
    EXPECT_EQ(result.value().logging.output, "console");
    EXPECT_TRUE(result.value().logging.categories.empty());
}

TEST_F(ConfigLoaderTest, ParseYaml) {
    const std::string yaml = R"(
mapper:
  dispatch_cache:
    max_entries: 64
logging:
  level: debug
  output: none
  include_thread_id: true
  categories:
    registry: trace
    dispatch: warn
)";

    auto result = loader_->parse_settings(yaml);
    ASSERT_TRUE(result.is_success()) << result.message();

    const auto& settings = result.value();
    EXPECT_EQ(settings.mapper.dispatch_cache.max_entries, 64u);
    EXPECT_EQ(settings.logging.level, "debug");
    EXPECT_EQ(settings.logging.output, "none");
    EXPECT_TRUE(settings.logging.include_thread_id);
    EXPECT_TRUE(settings.logging.include_timestamp);
    ASSERT_EQ(settings.logging.categories.size(), 2u);
    EXPECT_EQ(settings.logging.categories.at("registry"), "trace");
    EXPECT_EQ(settings.logging.categories.at("dispatch"), "warn");
}

TEST_F(ConfigLoaderTest, ParseJson) {
    const std::string json = R"({
  "mapper": { "dispatch_cache": { "max_entries": 10 } },
  "logging": {
    "level": "warn",
    "output": "file",
    "file_path": "/tmp/mapr.log",
    "max_file_size_mb": 2,
    "max_files": 3,
    "categories": { "mapping": "debug" }
  }
})";

    auto result = loader_->parse_settings(json);
    ASSERT_TRUE(result.is_success()) << result.message();

    const auto& settings = result.value();
    EXPECT_EQ(settings.mapper.dispatch_cache.max_entries, 10u);
    EXPECT_EQ(settings.logging.level, "warn");
    EXPECT_EQ(settings.logging.output, "file");
    EXPECT_EQ(settings.logging.file_path, "/tmp/mapr.log");
    EXPECT_EQ(settings.logging.max_file_size_mb, 2u);
    EXPECT_EQ(settings.logging.max_files, 3u);
    EXPECT_EQ(settings.logging.categories.at("mapping"), "debug");
}

TEST_F(ConfigLoaderTest, MalformedYamlIsParseError) {
    auto result = loader_->parse_settings("mapper: [unclosed", ConfigFormat::YAML);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST_F(ConfigLoaderTest, MalformedJsonIsParseError) {
    auto result = loader_->parse_settings("{\"mapper\": ", ConfigFormat::JSON);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_PARSE_ERROR);
    EXPECT_NE(result.message().find("JSON parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, WrongValueTypeIsTypeMismatch) {
    auto yaml = loader_->parse_settings("mapper:\n  dispatch_cache:\n    max_entries: lots\n");
    ASSERT_TRUE(yaml.is_error());
    EXPECT_EQ(yaml.code(), ErrorCode::CONFIG_TYPE_MISMATCH);

    auto json = loader_->parse_settings(R"({"logging": {"include_timestamp": [1, 2]}})");
    ASSERT_TRUE(json.is_error());
    EXPECT_EQ(json.code(), ErrorCode::CONFIG_TYPE_MISMATCH);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigLoaderTest, MaxEntriesMustBePositive) {
    auto zero = loader_->parse_settings("mapper:\n  dispatch_cache:\n    max_entries: 0\n");
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.code(), ErrorCode::CONFIG_VALUE_OUT_OF_RANGE);

    auto negative = loader_->parse_settings(R"({"mapper": {"dispatch_cache": {"max_entries": -4}}})");
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.code(), ErrorCode::CONFIG_VALUE_OUT_OF_RANGE);
}

TEST_F(ConfigLoaderTest, UnknownLevelsAreRejected) {
    auto global = loader_->parse_settings("logging:\n  level: chatty\n");
    ASSERT_TRUE(global.is_error());
    EXPECT_EQ(global.code(), ErrorCode::CONFIG_INVALID_VALUE);

    auto category = loader_->parse_settings("logging:\n  categories:\n    registry: loud\n");
    ASSERT_TRUE(category.is_error());
    EXPECT_EQ(category.code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_NE(category.message().find("registry"), std::string::npos);
}

TEST_F(ConfigLoaderTest, OutputValidation) {
    auto unknown = loader_->parse_settings("logging:\n  output: syslog\n");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.code(), ErrorCode::CONFIG_INVALID_VALUE);

    auto missing_path = loader_->parse_settings("logging:\n  output: file\n");
    ASSERT_TRUE(missing_path.is_error());
    EXPECT_EQ(missing_path.code(), ErrorCode::CONFIG_MISSING);
}

TEST_F(ConfigLoaderTest, ValidateDirectly) {
    MapperSettings settings;
    EXPECT_TRUE(loader_->validate(settings).is_success());

    settings.logging.level = "WARNING";
    EXPECT_TRUE(loader_->validate(settings).is_success());

    settings.mapper.dispatch_cache.max_entries = 0;
    EXPECT_EQ(loader_->validate(settings).code(), ErrorCode::CONFIG_VALUE_OUT_OF_RANGE);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigLoaderTest, LoadYamlFile) {
    auto path = temp_dir_ / "mapr.yaml";
    write(path, "mapper:\n  dispatch_cache:\n    max_entries: 128\n");

    auto result = loader_->load_settings(path);
    ASSERT_TRUE(result.is_success()) << result.message();
    EXPECT_EQ(result.value().mapper.dispatch_cache.max_entries, 128u);
}

TEST_F(ConfigLoaderTest, LoadJsonFileByExtension) {
    auto path = temp_dir_ / "mapr.json";
    write(path, R"({"logging": {"level": "error"}})");

    auto result = loader_->load_settings(path);
    ASSERT_TRUE(result.is_success()) << result.message();
    EXPECT_EQ(result.value().logging.level, "error");
}

TEST_F(ConfigLoaderTest, MissingFileIsNotFound) {
    auto result = loader_->load_settings(temp_dir_ / "absent.yaml");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_FILE_NOT_FOUND);
}

TEST_F(ConfigLoaderTest, SaveAndReload) {
    MapperSettings settings;
    settings.mapper.dispatch_cache.max_entries = 99;
    settings.logging.level = "trace";
    settings.logging.output = "none";
    settings.logging.categories["registry"] = "error";

    for (const char* name : {"nested/dir/settings.yaml", "settings.json"}) {
        auto path  = temp_dir_ / name;
        auto saved = loader_->save_settings(settings, path);
        ASSERT_TRUE(saved.is_success()) << saved.message();

        auto loaded = loader_->load_settings(path);
        ASSERT_TRUE(loaded.is_success()) << loaded.message();
        EXPECT_EQ(loaded.value().mapper.dispatch_cache.max_entries, 99u);
        EXPECT_EQ(loaded.value().logging.level, "trace");
        EXPECT_EQ(loaded.value().logging.output, "none");
        EXPECT_EQ(loaded.value().logging.categories.at("registry"), "error");
    }
}

TEST_F(ConfigLoaderTest, SerializeJsonLooksLikeJson) {
    MapperSettings settings;
    auto json = loader_->serialize_settings(settings, ConfigFormat::JSON);

    ASSERT_TRUE(json.is_success());
    EXPECT_EQ(ConfigLoader::detect_format_from_content(json.value()), ConfigFormat::JSON);
    EXPECT_NE(json.value().find("\"max_entries\" : 2048"), std::string::npos);
}

// ============================================================================
// Logging setup
// ============================================================================

TEST_F(ConfigLoaderTest, ApplyLoggingConfig) {
    LoggingConfig config;
    config.level  = "warn";
    config.output = "none";
    config.categories["registry"] = "debug";

    auto result = apply_logging_config(config);
    ASSERT_TRUE(result.is_success()) << result.message();

    auto& logger = debug::Logger::instance();
    EXPECT_EQ(logger.sink_count(), 0u);
    EXPECT_EQ(logger.filter().level(), debug::LogLevel::WARN);
    EXPECT_TRUE(logger.is_enabled(debug::LogLevel::DEBUG, "registry"));
    EXPECT_FALSE(logger.is_enabled(debug::LogLevel::DEBUG, "mapping"));
    EXPECT_TRUE(logger.is_enabled(debug::LogLevel::ERROR, "mapping"));
}

TEST_F(ConfigLoaderTest, ApplyFileLogging) {
    LoggingConfig config;
    config.output    = "file";
    config.file_path = (temp_dir_ / "mapr.log").string();

    auto result = apply_logging_config(config);
    ASSERT_TRUE(result.is_success()) << result.message();
    EXPECT_EQ(debug::Logger::instance().sink_count(), 1u);

    MAPR_LOG_INFO(debug::category::CONFIG, "written to file");
    debug::Logger::instance().flush();

    std::ifstream in(config.file_path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("written to file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, ApplyRejectsBadConfigWithoutSideEffects) {
    auto& logger      = debug::Logger::instance();
    auto sinks_before = logger.sink_count();

    LoggingConfig bad_level;
    bad_level.level = "nope";
    EXPECT_EQ(apply_logging_config(bad_level).code(), ErrorCode::CONFIG_INVALID_VALUE);

    LoggingConfig bad_category;
    bad_category.categories["mapping"] = "nope";
    EXPECT_EQ(apply_logging_config(bad_category).code(), ErrorCode::CONFIG_INVALID_VALUE);

    LoggingConfig bad_file;
    bad_file.output    = "file";
    bad_file.file_path = (temp_dir_ / "missing" / "dir" / "mapr.log").string();
    EXPECT_EQ(apply_logging_config(bad_file).code(), ErrorCode::FILE_ACCESS_DENIED);

    EXPECT_EQ(logger.sink_count(), sinks_before);
}

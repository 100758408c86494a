/// @file config_test.cpp
/// @brief Unit tests for config loading and conversion into JsonSink options.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "alerter/sinks/config.hpp"
#include "alerter/sinks/async_json_writer.hpp"

using alerter::sinks::ConfigError;
using alerter::sinks::DropPolicy;
using alerter::sinks::load_config;
using alerter::sinks::parse_config;
using alerter::sinks::parse_drop_policy;
using alerter::sinks::to_json_sink_options;

TEST(ConfigTest, EmptyObjectYieldsDefaults) {
    auto config = parse_config("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sink.verbosity, 0);
    EXPECT_EQ(config->sink.queue_size, 10000u);
    EXPECT_EQ(config->sink.drop_policy, "drop_oldest");
    EXPECT_EQ(config->sink.output_path, "logs/alerter.log.json");
    EXPECT_EQ(config->sink.name_separator, "/");
    EXPECT_TRUE(config->name.empty());
}

TEST(ConfigTest, ParsesAllFields) {
    auto config = parse_config(R"({
        "name": "demo",
        "sink": {
            "verbosity": 3,
            "queue_size": 16,
            "drop_policy": "drop_newest",
            "output_path": "out/x.json",
            "name_separator": "."
        }
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->name, "demo");
    EXPECT_EQ(config->sink.verbosity, 3);
    EXPECT_EQ(config->sink.queue_size, 16u);
    EXPECT_EQ(config->sink.drop_policy, "drop_newest");
    EXPECT_EQ(config->sink.output_path, "out/x.json");
    EXPECT_EQ(config->sink.name_separator, ".");
}

TEST(ConfigTest, PartialSinkKeepsOtherDefaults) {
    auto config = parse_config(R"({"sink": {"verbosity": 2}})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sink.verbosity, 2);
    EXPECT_EQ(config->sink.queue_size, 10000u);
}

TEST(ConfigTest, RejectsInvalidValues) {
    const char* cases[] = {
        R"({"sink": {"verbosity": -1}})",
        R"({"sink": {"verbosity": "high"}})",
        R"({"sink": {"queue_size": 0}})",
        R"({"sink": {"drop_policy": "drop_all"}})",
        R"({"sink": {"output_path": ""}})",
        R"({"sink": {"name_separator": ""}})",
        R"({"sink": 5})",
        R"({"name": 7})",
        R"([1, 2])",
        R"(not json)",
    };
    for (const char* text : cases) {
        auto config = parse_config(text);
        ASSERT_FALSE(config.has_value()) << text;
        EXPECT_EQ(config.error(), ConfigError::ParseFailed) << text;
    }
}

TEST(ConfigTest, MissingFileFailsToOpen) {
    auto config = load_config("/nonexistent/alerter/config.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::FileOpenFailed);
}

TEST(ConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "alerter_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"name": "svc", "sink": {"verbosity": 1}})";
    }
    auto config = load_config(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->name, "svc");
    EXPECT_EQ(config->sink.verbosity, 1);
}

TEST(ConfigTest, ConvertsToJsonSinkOptions) {
    auto config = parse_config(R"({"sink": {"verbosity": 4, "drop_policy": "drop_newest"}})");
    ASSERT_TRUE(config.has_value());
    auto options = to_json_sink_options(*config);
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->verbosity, 4);
    EXPECT_EQ(options->drop_policy, DropPolicy::DropNewest);
    EXPECT_EQ(options->output_path, "logs/alerter.log.json");
}

TEST(ConfigTest, ConversionRejectsUnknownDropPolicy) {
    auto config = alerter::sinks::default_config();
    config.sink.drop_policy = "sometimes";
    auto options = to_json_sink_options(config);
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error(), ConfigError::ParseFailed);
}

TEST(ConfigTest, DropPolicyRoundTripsThroughConfigSpelling) {
    EXPECT_EQ(parse_drop_policy("drop_oldest"), DropPolicy::DropOldest);
    EXPECT_EQ(parse_drop_policy("drop_newest"), DropPolicy::DropNewest);
    EXPECT_FALSE(parse_drop_policy("DROP_OLDEST").has_value());
    EXPECT_EQ(alerter::sinks::to_string(DropPolicy::DropNewest), "drop_newest");
}

TEST(ConfigTest, ConfigErrorConvertsToErrorCode) {
    std::error_code ec = ConfigError::FileOpenFailed;
    EXPECT_TRUE(ec);
    EXPECT_STREQ(ec.category().name(), "alerter.config");
    EXPECT_EQ(ec.message(), alerter::sinks::to_string(ConfigError::FileOpenFailed));
    EXPECT_EQ(ec, ConfigError::FileOpenFailed);
    EXPECT_NE(ec, ConfigError::ParseFailed);
}

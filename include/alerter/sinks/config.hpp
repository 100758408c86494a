#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "alerter/sinks/json_sink.hpp"

namespace alerter::sinks
{

  /** Errors returned while loading a config file. */
  enum class ConfigError
  {
    FileOpenFailed = 1,
    ParseFailed
  };

  /** JSON sink section of the config file. */
  struct SinkConfig
  {
    int verbosity;
    std::size_t queue_size;
    std::string drop_policy;
    std::string output_path;
    std::string name_separator;
  };

  /** Top-level configuration loaded from a JSON file. */
  struct Config
  {
    SinkConfig sink;
    // Root name segment; empty for an unnamed root.
    std::string name;
  };

  /**
   * Return the configuration used when no file is given.
   * @return Config with every field at its default.
   */
  [[nodiscard]] Config default_config();
  /**
   * Load and parse a config file.
   * @param path Path to the JSON file.
   * @return Parsed Config or ConfigError.
   */
  [[nodiscard]] std::expected<Config, ConfigError> load_config(const std::string &path);
  /**
   * Parse config JSON held in memory.
   * @param content JSON text.
   * @return Parsed Config or ConfigError.
   */
  [[nodiscard]] std::expected<Config, ConfigError> parse_config(std::string_view content);
  /**
   * Convert a loaded config into JsonSink options.
   * @param config Loaded config.
   * @return Options or ConfigError::ParseFailed for an unknown drop policy.
   */
  [[nodiscard]] std::expected<JsonSinkOptions, ConfigError> to_json_sink_options(
      const Config &config);

  /**
   * Convert ConfigError to a string literal.
   * @param error Error to stringify.
   * @return String literal describing the error.
   */
  [[nodiscard]] const char *to_string(ConfigError error);
  /**
   * Wrap a ConfigError for Alerter::error().
   * @param error Error to wrap.
   * @return std::error_code in the alerter config category.
   */
  [[nodiscard]] std::error_code make_error_code(ConfigError error);

} // namespace alerter::sinks

template <>
struct std::is_error_code_enum<alerter::sinks::ConfigError> : std::true_type
{
};

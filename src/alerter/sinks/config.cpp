#include "alerter/sinks/config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <simdjson.h>

#include "alerter/sinks/async_json_writer.hpp"

namespace alerter::sinks
{

  namespace
  {

    class ConfigCategory final : public std::error_category
    {
    public:
      const char *name() const noexcept override { return "alerter.config"; }

      std::string message(int condition) const override
      {
        return to_string(static_cast<ConfigError>(condition));
      }
    };

    /**
     * Read an optional member of a JSON object.
     * @tparam Json Type requested from simdjson.
     * @tparam Out Type stored in the result; std::string_view is copied out of
     *             the parser buffer by reading it as std::string.
     * @return std::nullopt when the key is absent, ParseFailed when it holds
     *         the wrong type.
     */
    template <typename Json, typename Out = Json>
    std::expected<std::optional<Out>, ConfigError>
    read_optional(simdjson::ondemand::object &obj, std::string_view key)
    {
      auto field = obj[key];
      if (field.error() == simdjson::NO_SUCH_FIELD)
      {
        return std::optional<Out>{};
      }
      Json value{};
      if (field.get(value) != simdjson::SUCCESS)
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      return std::optional<Out>{Out(value)};
    }

    std::expected<SinkConfig, ConfigError>
    parse_sink(simdjson::ondemand::object &root, SinkConfig base)
    {
      auto sink = root["sink"].get_object();
      if (sink.error())
      {
        return std::unexpected(ConfigError::ParseFailed);
      }

      auto verbosity = read_optional<std::int64_t>(sink.value(), "verbosity");
      auto queue_size = read_optional<std::uint64_t>(sink.value(), "queue_size");
      auto drop_policy = read_optional<std::string_view, std::string>(sink.value(), "drop_policy");
      auto output_path = read_optional<std::string_view, std::string>(sink.value(), "output_path");
      auto separator = read_optional<std::string_view, std::string>(sink.value(), "name_separator");

      if (!verbosity || !queue_size || !drop_policy || !output_path || !separator)
      {
        return std::unexpected(ConfigError::ParseFailed);
      }

      if (verbosity->has_value())
      {
        if (**verbosity < 0 || **verbosity > std::numeric_limits<int>::max())
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.verbosity = static_cast<int>(**verbosity);
      }

      if (queue_size->has_value())
      {
        if (**queue_size == 0)
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.queue_size = static_cast<std::size_t>(**queue_size);
      }

      if (drop_policy->has_value())
      {
        if (!parse_drop_policy(**drop_policy))
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.drop_policy = std::move(**drop_policy);
      }

      if (output_path->has_value())
      {
        if ((*output_path)->empty())
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.output_path = std::move(**output_path);
      }

      if (separator->has_value())
      {
        if ((*separator)->empty())
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.name_separator = std::move(**separator);
      }

      return base;
    }

  } // namespace

  Config default_config()
  {
    return Config{.sink = SinkConfig{.verbosity = 0,
                                     .queue_size = 10000,
                                     .drop_policy = "drop_oldest",
                                     .output_path = "logs/alerter.log.json",
                                     .name_separator = "/"},
                  .name = {}};
  }

  std::expected<Config, ConfigError> load_config(const std::string &path)
  {
    std::ifstream file(path);
    if (!file.is_open())
    {
      return std::unexpected(ConfigError::FileOpenFailed);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
  }

  std::expected<Config, ConfigError> parse_config(std::string_view content)
  {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(content);
    auto doc = parser.iterate(padded);
    if (doc.error())
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    auto root = doc.get_object();
    if (root.error())
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    Config config = default_config();

    if (auto sink = root.value()["sink"]; !sink.error())
    {
      auto parsed = parse_sink(root.value(), config.sink);
      if (!parsed)
      {
        return std::unexpected(parsed.error());
      }
      config.sink = std::move(*parsed);
    }
    else if (sink.error() != simdjson::NO_SUCH_FIELD)
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    auto name = read_optional<std::string_view, std::string>(root.value(), "name");
    if (!name)
    {
      return std::unexpected(name.error());
    }
    if (name->has_value())
    {
      config.name = std::move(**name);
    }

    return config;
  }

  std::expected<JsonSinkOptions, ConfigError> to_json_sink_options(const Config &config)
  {
    auto drop_policy = parse_drop_policy(config.sink.drop_policy);
    if (!drop_policy)
    {
      return std::unexpected(ConfigError::ParseFailed);
    }
    return JsonSinkOptions{.verbosity = config.sink.verbosity,
                           .queue_size = config.sink.queue_size,
                           .drop_policy = *drop_policy,
                           .output_path = config.sink.output_path,
                           .name_separator = config.sink.name_separator};
  }

  const char *to_string(ConfigError error)
  {
    switch (error)
    {
    case ConfigError::FileOpenFailed:
      return "config file could not be opened";
    case ConfigError::ParseFailed:
      return "config file is invalid";
    }
    return "unknown config error";
  }

  std::error_code make_error_code(ConfigError error)
  {
    static const ConfigCategory category;
    return {static_cast<int>(error), category};
  }

} // namespace alerter::sinks

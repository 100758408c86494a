#include "alerter/alerter.hpp"
#include "alerter/marshaler.hpp"
#include "alerter/sinks/config.hpp"
#include "alerter/sinks/json_sink.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

  // Connection credentials; the secret never reaches the output.
  struct Credentials final : alerter::Marshaler
  {
    Credentials(std::string user_name, std::string secret)
        : user(std::move(user_name)), token(std::move(secret))
    {
    }

    std::string user;
    std::string token;

    alerter::Value marshal_alert() const override
    {
      return alerter::Fields{{"user", user}, {"token", "<redacted>"}};
    }
  };

  struct AppContext
  {
    alerter::sinks::Config config;
    bool config_missing = false;

    static std::optional<AppContext> build(const std::string &config_path)
    {
      auto config_result = alerter::sinks::load_config(config_path);
      if (!config_result)
      {
        if (config_result.error() != alerter::sinks::ConfigError::FileOpenFailed)
        {
          std::cerr << "invalid config: " << alerter::sinks::to_string(config_result.error())
                    << std::endl;
          return std::nullopt;
        }
        return AppContext{.config = alerter::sinks::default_config(), .config_missing = true};
      }
      return AppContext{.config = std::move(*config_result), .config_missing = false};
    }
  };

} // namespace

int main(int argc, char **argv)
{
  const std::string config_path = argc > 1 ? argv[1] : "config.json";

  auto ctx = AppContext::build(config_path);
  if (!ctx)
  {
    return 1;
  }

  auto options = alerter::sinks::to_json_sink_options(ctx->config);
  if (!options)
  {
    std::cerr << "invalid config: " << alerter::sinks::to_string(options.error()) << std::endl;
    return 1;
  }

  alerter::Alerter log = alerter::sinks::new_json_alerter(*options);
  if (!ctx->config.name.empty())
  {
    log = log.with_name(ctx->config.name);
  }

  if (ctx->config_missing)
  {
    log.error(alerter::sinks::ConfigError::FileOpenFailed, "config_defaults_used",
              {{"path", config_path}});
  }

  log.info("config",
           {{"verbosity", options->verbosity},
            {"queue_size", options->queue_size},
            {"drop_policy", alerter::sinks::to_string(options->drop_policy)},
            {"output_path", options->output_path}});

  auto session = log.with_name("session").with_values(
      {{"session_id", 42}, {"peers", std::vector<std::string>{"alpha", "beta"}}});

  session.info("connected", {{"credentials", Credentials("demo", "s3cr3t")}});
  session.v(1).info("handshake_details", {{"latency_ms", 12.5}, {"tls", true}});
  session.v(2).info("frame_dump", {{"bytes", 512u}});

  for (int attempt = 1; attempt <= 3; ++attempt)
  {
    session.v(1).info("retry", {{"attempt", attempt}});
  }

  session.error(std::make_error_code(std::errc::connection_reset), "connection_lost",
                {{"retries", 3}});
  session.error({}, "session_closed");
  return 0;
}

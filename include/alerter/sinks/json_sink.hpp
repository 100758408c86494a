#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "alerter/alerter.hpp"
#include "alerter/sinks/async_json_writer.hpp"

namespace alerter::sinks
{

  /** Configuration for JsonSink. */
  struct JsonSinkOptions
  {
    // Highest verbosity emitted by info().
    int verbosity = 0;
    std::size_t queue_size = 10000;
    DropPolicy drop_policy = DropPolicy::DropOldest;
    std::string output_path = "logs/alerter.log.json";
    std::string name_separator = "/";
  };

  /**
   * Sink writing one JSON object per line through an AsyncJsonWriter.
   *
   * Line layout: ts_ms, kind, v (info only), logger (when named), msg,
   * error (error only), attached values, call-site values. Values are
   * rendered on the calling thread, so a Marshaler is only invoked while the
   * logging call is in progress.
   */
  class JsonSink final : public Sink
  {
  public:
    /**
     * Construct a root sink and start its writer.
     * @param options Sink configuration options.
     */
    explicit JsonSink(const JsonSinkOptions &options);

    [[nodiscard]] bool enabled(int level) const override { return level <= verbosity_; }

    void info(int level, std::string_view msg, const Fields &fields) const override;
    void error(std::error_code err, std::string_view msg, const Fields &fields) const override;

    [[nodiscard]] std::shared_ptr<const Sink> with_values(const Fields &fields) const override;
    [[nodiscard]] std::shared_ptr<const Sink> with_name(std::string_view name) const override;

  private:
    void begin_line(std::string &line, std::string_view kind) const;
    void append_logger(std::string &line) const;
    void finish_line(std::string &line, const Fields &fields) const;

    std::shared_ptr<AsyncJsonWriter> writer_;
    int verbosity_;
    std::string separator_;
    std::string name_;
    // Attached values, pre-rendered as ,"key":value members.
    std::string values_;
  };

  /**
   * Build an Alerter writing JSON lines.
   * @param options Sink configuration options.
   * @return Handle at verbosity 0 bound to a new JsonSink.
   */
  [[nodiscard]] Alerter new_json_alerter(const JsonSinkOptions &options);

} // namespace alerter::sinks

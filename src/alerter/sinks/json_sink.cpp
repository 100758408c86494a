#include "alerter/sinks/json_sink.hpp"

#include <utility>

#include "alerter/sinks/json_encoding.hpp"

namespace alerter::sinks
{

  JsonSink::JsonSink(const JsonSinkOptions &options)
      : writer_(std::make_shared<AsyncJsonWriter>(
            AsyncJsonWriterOptions{.queue_size = options.queue_size,
                                   .drop_policy = options.drop_policy,
                                   .output_path = options.output_path})),
        verbosity_(options.verbosity), separator_(options.name_separator)
  {
  }

  void JsonSink::info(int level, std::string_view msg, const Fields &fields) const
  {
    std::string line;
    line.reserve(256);
    begin_line(line, "info");
    line += ",\"v\":";
    line += std::to_string(level);
    append_logger(line);
    line += ",\"msg\":\"";
    append_json_string(line, msg);
    line += '"';
    finish_line(line, fields);
    writer_->write(std::move(line));
  }

  void JsonSink::error(std::error_code err, std::string_view msg, const Fields &fields) const
  {
    std::string line;
    line.reserve(256);
    begin_line(line, "error");
    append_logger(line);
    line += ",\"msg\":\"";
    append_json_string(line, msg);
    line += "\",\"error\":";
    if (err)
    {
      line += '"';
      append_json_string(line, err.message());
      line += '"';
    }
    else
    {
      line += "null";
    }
    finish_line(line, fields);
    writer_->write(std::move(line));
  }

  std::shared_ptr<const Sink> JsonSink::with_values(const Fields &fields) const
  {
    auto derived = std::make_shared<JsonSink>(*this);
    append_json_members(derived->values_, fields);
    return derived;
  }

  std::shared_ptr<const Sink> JsonSink::with_name(std::string_view name) const
  {
    auto derived = std::make_shared<JsonSink>(*this);
    if (!derived->name_.empty())
    {
      derived->name_ += separator_;
    }
    derived->name_ += name;
    return derived;
  }

  void JsonSink::begin_line(std::string &line, std::string_view kind) const
  {
    line += "{\"ts_ms\":";
    line += std::to_string(now_ms());
    line += ",\"kind\":\"";
    line += kind;
    line += '"';
  }

  void JsonSink::append_logger(std::string &line) const
  {
    if (name_.empty())
    {
      return;
    }
    line += ",\"logger\":\"";
    append_json_string(line, name_);
    line += '"';
  }

  void JsonSink::finish_line(std::string &line, const Fields &fields) const
  {
    line += values_;
    append_json_members(line, fields);
    line += '}';
  }

  Alerter new_json_alerter(const JsonSinkOptions &options)
  {
    return Alerter(std::make_shared<JsonSink>(options));
  }

} // namespace alerter::sinks

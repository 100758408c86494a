#include "alerter/sinks/tee_sink.hpp"

#include <utility>

namespace alerter::sinks
{

  bool TeeSink::enabled(int level) const
  {
    return (first_ && first_->enabled(level)) || (second_ && second_->enabled(level));
  }

  void TeeSink::info(int level, std::string_view msg, const Fields &fields) const
  {
    if (first_ && first_->enabled(level))
    {
      first_->info(level, msg, fields);
    }
    if (second_ && second_->enabled(level))
    {
      second_->info(level, msg, fields);
    }
  }

  void TeeSink::error(std::error_code err, std::string_view msg, const Fields &fields) const
  {
    if (first_)
    {
      first_->error(err, msg, fields);
    }
    if (second_)
    {
      second_->error(err, msg, fields);
    }
  }

  std::shared_ptr<const Sink> TeeSink::with_values(const Fields &fields) const
  {
    return std::make_shared<TeeSink>(first_ ? first_->with_values(fields) : nullptr,
                                     second_ ? second_->with_values(fields) : nullptr);
  }

  std::shared_ptr<const Sink> TeeSink::with_name(std::string_view name) const
  {
    return std::make_shared<TeeSink>(first_ ? first_->with_name(name) : nullptr,
                                     second_ ? second_->with_name(name) : nullptr);
  }

  Alerter tee(const Alerter &alerter, std::shared_ptr<const Sink> extra)
  {
    return alerter.with_sink(std::make_shared<TeeSink>(alerter.sink(), std::move(extra)));
  }

} // namespace alerter::sinks

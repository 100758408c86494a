#include "alerter/alerter.hpp"

#include <limits>
#include <utility>

namespace alerter
{

  Alerter::Alerter(std::shared_ptr<const Sink> sink) : sink_(std::move(sink)) {}

  bool Alerter::enabled() const { return sink_ != nullptr && sink_->enabled(level_); }

  void Alerter::info(std::string_view msg, const Fields &fields) const
  {
    if (sink_ != nullptr && enabled())
    {
      sink_->info(level_, msg, fields);
    }
  }

  void Alerter::error(std::error_code err, std::string_view msg, const Fields &fields) const
  {
    if (sink_ != nullptr)
    {
      sink_->error(err, msg, fields);
    }
  }

  Alerter Alerter::v(int level) const
  {
    Alerter derived = *this;
    if (derived.sink_ == nullptr || level <= 0)
    {
      return derived;
    }
    // Saturate instead of wrapping.
    if (level > std::numeric_limits<int>::max() - derived.level_)
    {
      derived.level_ = std::numeric_limits<int>::max();
    }
    else
    {
      derived.level_ += level;
    }
    return derived;
  }

  Alerter Alerter::with_values(const Fields &fields) const
  {
    Alerter derived = *this;
    if (derived.sink_ != nullptr)
    {
      derived.sink_ = sink_->with_values(fields);
    }
    return derived;
  }

  Alerter Alerter::with_name(std::string_view name) const
  {
    Alerter derived = *this;
    if (derived.sink_ != nullptr)
    {
      derived.sink_ = sink_->with_name(name);
    }
    return derived;
  }

  Alerter Alerter::with_sink(std::shared_ptr<const Sink> sink) const
  {
    Alerter derived = *this;
    derived.sink_ = std::move(sink);
    return derived;
  }

} // namespace alerter

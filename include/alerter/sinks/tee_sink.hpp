#pragma once

#include <memory>
#include <string_view>
#include <system_error>
#include <utility>

#include "alerter/alerter.hpp"

namespace alerter::sinks
{

  /**
   * Fan-out sink forwarding every call to two sinks.
   *
   * info() reaches only the sides enabled at the given level; error() reaches
   * both. Either side may be null and is then ignored.
   */
  class TeeSink final : public Sink
  {
  public:
    /**
     * Construct from two sinks.
     * @param first Primary sink.
     * @param second Additional sink.
     */
    TeeSink(std::shared_ptr<const Sink> first, std::shared_ptr<const Sink> second)
        : first_(std::move(first)), second_(std::move(second))
    {
    }

    [[nodiscard]] bool enabled(int level) const override;

    void info(int level, std::string_view msg, const Fields &fields) const override;
    void error(std::error_code err, std::string_view msg, const Fields &fields) const override;

    [[nodiscard]] std::shared_ptr<const Sink> with_values(const Fields &fields) const override;
    [[nodiscard]] std::shared_ptr<const Sink> with_name(std::string_view name) const override;

  private:
    std::shared_ptr<const Sink> first_;
    std::shared_ptr<const Sink> second_;
  };

  /**
   * Rebind a handle so that its entries also reach another sink.
   * @param alerter Handle to extend; its verbosity is kept.
   * @param extra Additional sink.
   * @return Handle bound to a TeeSink.
   */
  [[nodiscard]] Alerter tee(const Alerter &alerter, std::shared_ptr<const Sink> extra);

} // namespace alerter::sinks

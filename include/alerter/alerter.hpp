#pragma once

#include <memory>
#include <string_view>
#include <system_error>

#include "alerter/fields.hpp"
#include "alerter/marshaler.hpp"
#include "alerter/sink.hpp"

namespace alerter
{

  /**
   * Value-typed handle applications log through.
   *
   * All real work is passed on to a Sink. Every derivation returns a new
   * handle; the original and everything already derived from it keep
   * behaving as before. A handle without a sink is permanently disabled and
   * every operation on it is a no-op.
   *
   * @code
   *   auto log = alerter::sinks::new_json_alerter(options).with_name("feed");
   *   log.v(1).info("reconnecting", {{"attempt", 3}});
   *   log.error(ec, "read failed", {{"bytes", n}});
   * @endcode
   */
  class Alerter
  {
  public:
    /** Construct a disabled handle. */
    Alerter() = default;

    /**
     * Construct a handle at verbosity 0 bound to a sink.
     * @param sink Backend; nullptr yields a disabled handle.
     */
    explicit Alerter(std::shared_ptr<const Sink> sink);

    /**
     * Return true if info entries of this handle would be emitted.
     * @return sink != nullptr && sink->enabled(level()).
     */
    [[nodiscard]] bool enabled() const;

    /**
     * Alert a non-error message if this handle is enabled.
     * @param msg Constant description of the entry.
     * @param fields Variable information as key/value pairs.
     */
    void info(std::string_view msg, const Fields &fields = {}) const;

    /**
     * Alert an error regardless of verbosity.
     * @param err Error that triggered the entry, if any.
     * @param msg Context for the error.
     * @param fields Variable information as key/value pairs.
     */
    void error(std::error_code err, std::string_view msg, const Fields &fields = {}) const;

    /**
     * Return a handle whose verbosity is raised by level. V-levels are
     * additive and negative increments count as 0. A higher verbosity means
     * a less important message.
     * @param level Increment relative to this handle.
     * @return Derived handle.
     */
    [[nodiscard]] Alerter v(int level) const;

    /**
     * Return a handle whose entries carry additional key/value pairs.
     * @param fields Pairs to attach.
     * @return Derived handle.
     */
    [[nodiscard]] Alerter with_values(const Fields &fields) const;

    /**
     * Return a handle with a segment appended to its name. Successive calls
     * append further segments; the sink decides how they are joined.
     * Segments should contain only letters, digits and hyphens.
     * @param name Segment to append.
     * @return Derived handle.
     */
    [[nodiscard]] Alerter with_name(std::string_view name) const;

    /**
     * Return a copy of this handle bound to another sink, keeping the
     * verbosity.
     * @param sink Replacement backend.
     * @return Rebound handle.
     */
    [[nodiscard]] Alerter with_sink(std::shared_ptr<const Sink> sink) const;

    [[nodiscard]] const std::shared_ptr<const Sink> &sink() const { return sink_; }
    [[nodiscard]] int level() const { return level_; }

  private:
    std::shared_ptr<const Sink> sink_;
    int level_ = 0;
  };

} // namespace alerter

#pragma once

#include <memory>
#include <string_view>
#include <system_error>

#include "alerter/fields.hpp"

namespace alerter
{

  /**
   * Backend interface behind an Alerter.
   *
   * Implementations carry their own name and context and must be safe for
   * concurrent use: one sink instance is typically reached by many handles
   * on many threads. None of the operations may report a failure to the
   * caller; internal faults are swallowed or reported in-band.
   *
   * Implementations should provide their own constructors that return an
   * Alerter rather than a bare Sink.
   */
  class Sink
  {
  public:
    virtual ~Sink() = default;

    /**
     * Return true if info entries at the given verbosity are emitted.
     * Must be cheap and free of side effects.
     * @param level Accumulated verbosity of the calling handle.
     * @return True if enabled.
     */
    [[nodiscard]] virtual bool enabled(int level) const = 0;

    /**
     * Emit a non-error entry. Only called after enabled(level) returned true.
     * @param level Accumulated verbosity of the calling handle.
     * @param msg Constant description of the entry.
     * @param fields Call-site key/value pairs.
     */
    virtual void info(int level, std::string_view msg, const Fields &fields) const = 0;

    /**
     * Emit an error entry. Called regardless of verbosity.
     * @param err Underlying cause; a default-constructed code means none.
     * @param msg Context for the error.
     * @param fields Call-site key/value pairs.
     */
    virtual void error(std::error_code err, std::string_view msg, const Fields &fields) const = 0;

    /**
     * Return a new sink whose entries also carry the given pairs, after the
     * ones already attached. The receiver is left unchanged.
     * @param fields Pairs to attach.
     * @return Derived sink.
     */
    [[nodiscard]] virtual std::shared_ptr<const Sink> with_values(const Fields &fields) const = 0;

    /**
     * Return a new sink with a name segment appended. The receiver is left
     * unchanged.
     * @param name Segment to append.
     * @return Derived sink.
     */
    [[nodiscard]] virtual std::shared_ptr<const Sink> with_name(std::string_view name) const = 0;
  };

} // namespace alerter

#pragma once

#include "alerter/fields.hpp"

namespace alerter
{

  /**
   * Optional interface for alerted values.
   *
   * Sinks with structured output render the value returned by
   * marshal_alert() instead of the original. Only one substitution pass is
   * guaranteed: a substitute that is itself a Marshaler is not marshaled
   * again.
   *
   * Typical uses:
   *   - render a type as an object instead of its default string form
   *   - select which members of a complex type get alerted
   *   - expose private members through a plain Fields object
   */
  class Marshaler
  {
  public:
    virtual ~Marshaler() = default;

    /**
     * Return the representation to render in place of this value.
     * @return Substitute value of any shape.
     */
    [[nodiscard]] virtual Value marshal_alert() const = 0;
  };

} // namespace alerter

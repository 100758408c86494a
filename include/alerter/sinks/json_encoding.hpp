#pragma once

#include <string>
#include <string_view>

#include "alerter/fields.hpp"

namespace alerter::sinks
{

  // Deepest nesting of objects rendered before "<max-depth>" is written.
  inline constexpr int kMaxRenderDepth = 16;

  /**
   * Append text escaped for use inside a JSON string literal.
   *
   * Each byte of a malformed UTF-8 sequence is replaced by U+FFFD.
   * @param out Destination buffer.
   * @param text Unescaped text.
   */
  void append_json_string(std::string &out, std::string_view text);

  /**
   * Append a value as JSON.
   *
   * A Marshaler is replaced by its substitute once; a substitute that is
   * itself a Marshaler is written as "<marshaler>". A marshal_alert() that
   * throws is written as "<panic: what>", or "<panic: unknown>" when the
   * exception is not a std::exception. Doubles use the shortest form that
   * round-trips; non-finite doubles become null.
   * @param out Destination buffer.
   * @param value Value to render.
   */
  void append_json_value(std::string &out, const Value &value);

  /**
   * Append every pair as ,"key":value (each preceded by a comma), in order
   * and including duplicates.
   * @param out Destination buffer.
   * @param fields Pairs to render.
   */
  void append_json_members(std::string &out, const Fields &fields);

} // namespace alerter::sinks

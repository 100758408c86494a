#include "alerter/sinks/json_encoding.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <exception>
#include <memory>
#include <type_traits>
#include <vector>

#include "alerter/marshaler.hpp"

namespace alerter::sinks
{

  namespace
  {

    constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

    bool is_continuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

    // Length of the well-formed multi-byte UTF-8 sequence starting at pos, or 0
    // if it is malformed (bad lead byte, truncated, overlong, surrogate or above
    // U+10FFFF).
    std::size_t utf8_sequence_length(std::string_view text, std::size_t pos)
    {
      const auto lead = static_cast<unsigned char>(text[pos]);
      std::size_t length = 0;
      unsigned char second_min = 0x80;
      unsigned char second_max = 0xBF;
      if (lead >= 0xC2 && lead <= 0xDF)
      {
        length = 2;
      }
      else if (lead >= 0xE0 && lead <= 0xEF)
      {
        length = 3;
        if (lead == 0xE0)
        {
          second_min = 0xA0;
        }
        else if (lead == 0xED)
        {
          second_max = 0x9F;
        }
      }
      else if (lead >= 0xF0 && lead <= 0xF4)
      {
        length = 4;
        if (lead == 0xF0)
        {
          second_min = 0x90;
        }
        else if (lead == 0xF4)
        {
          second_max = 0x8F;
        }
      }
      else
      {
        return 0;
      }

      if (pos + length > text.size())
      {
        return 0;
      }
      const auto second = static_cast<unsigned char>(text[pos + 1]);
      if (second < second_min || second > second_max)
      {
        return 0;
      }
      for (std::size_t i = 2; i < length; ++i)
      {
        if (!is_continuation(static_cast<unsigned char>(text[pos + i])))
        {
          return 0;
        }
      }
      return length;
    }

    void append_control_escape(std::string &out, unsigned char c)
    {
      static constexpr char kHex[] = "0123456789ABCDEF";
      out += "\\u00";
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }

    void append_double(std::string &out, double value)
    {
      if (!std::isfinite(value))
      {
        out += "null";
        return;
      }
      char buffer[32];
      auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
      if (ec != std::errc())
      {
        out += "null";
        return;
      }
      out.append(buffer, end);
    }

    void append_quoted(std::string &out, std::string_view text)
    {
      out += '"';
      append_json_string(out, text);
      out += '"';
    }

    void append_value(std::string &out, const Value &value, int depth, bool substitute);

    void append_object(std::string &out, const Fields &object, int depth)
    {
      out += '{';
      const auto &entries = object.entries();
      for (std::size_t i = 0; i < entries.size(); ++i)
      {
        if (i > 0)
        {
          out += ',';
        }
        append_quoted(out, entries[i].key);
        out += ':';
        append_value(out, entries[i].value, depth + 1, true);
      }
      out += '}';
    }

    void append_marshaled(std::string &out,
                          const Marshaler &marshaler,
                          int depth)
    {
      Value substitute;
      try
      {
        substitute = marshaler.marshal_alert();
      }
      catch (const std::exception &e)
      {
        std::string text = "<panic: ";
        text += e.what();
        text += '>';
        append_quoted(out, text);
        return;
      }
      catch (...)
      {
        append_quoted(out, "<panic: unknown>");
        return;
      }
      append_value(out, substitute, depth, false);
    }

    void append_value(std::string &out, const Value &value, int depth, bool substitute)
    {
      if (depth > kMaxRenderDepth)
      {
        append_quoted(out, "<max-depth>");
        return;
      }

      value.visit(
          [&](const auto &val)
          {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>)
            {
              out += "null";
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
              out += (val ? "true" : "false");
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
              out += std::to_string(val);
            }
            else if constexpr (std::is_same_v<T, std::uint64_t>)
            {
              out += std::to_string(val);
            }
            else if constexpr (std::is_same_v<T, double>)
            {
              append_double(out, val);
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
              append_quoted(out, val);
            }
            else if constexpr (std::is_same_v<T, std::vector<std::string>>)
            {
              out += '[';
              for (std::size_t i = 0; i < val.size(); ++i)
              {
                if (i > 0)
                {
                  out += ',';
                }
                append_quoted(out, val[i]);
              }
              out += ']';
            }
            else if constexpr (std::is_same_v<T, Fields>)
            {
              append_object(out, val, depth);
            }
            else if constexpr (std::is_same_v<T, std::shared_ptr<const Marshaler>>)
            {
              if (!val)
              {
                out += "null";
              }
              else if (!substitute)
              {
                append_quoted(out, "<marshaler>");
              }
              else
              {
                append_marshaled(out, *val, depth);
              }
            }
          });
    }

  } // namespace

  void append_json_string(std::string &out, std::string_view text)
  {
    std::size_t pos = 0;
    while (pos < text.size())
    {
      const auto c = static_cast<unsigned char>(text[pos]);
      if (c >= 0x80)
      {
        const auto length = utf8_sequence_length(text, pos);
        if (length == 0)
        {
          out += kReplacementCharacter;
          ++pos;
        }
        else
        {
          out += text.substr(pos, length);
          pos += length;
        }
        continue;
      }

      switch (c)
      {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20)
        {
          append_control_escape(out, c);
        }
        else
        {
          out += static_cast<char>(c);
        }
        break;
      }
      ++pos;
    }
  }

  void append_json_value(std::string &out, const Value &value)
  {
    append_value(out, value, 0, true);
  }

  void append_json_members(std::string &out, const Fields &fields)
  {
    for (const auto &field : fields.entries())
    {
      out += ',';
      append_quoted(out, field.key);
      out += ':';
      append_value(out, field.value, 0, true);
    }
  }

} // namespace alerter::sinks

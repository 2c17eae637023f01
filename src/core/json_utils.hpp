#ifndef RECONKIT_CORE_JSON_UTILS_HPP_
#define RECONKIT_CORE_JSON_UTILS_HPP_

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace reconkit::core {

namespace detail {

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 when the
// bytes there are not one (overlong forms, surrogates and values past
// U+10FFFF included).
inline std::size_t Utf8SequenceLength(std::string_view input, std::size_t pos) {
  const auto byte_at = [&input](std::size_t i) { return static_cast<unsigned char>(input[i]); };
  const unsigned char lead = byte_at(pos);
  std::size_t length = 0;
  unsigned char low = 0x80U;
  unsigned char high = 0xBFU;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2;
  } else if (lead >= 0xE0U && lead <= 0xEFU) {
    length = 3;
    if (lead == 0xE0U) {
      low = 0xA0U;
    } else if (lead == 0xEDU) {
      high = 0x9FU;
    }
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    length = 4;
    if (lead == 0xF0U) {
      low = 0x90U;
    } else if (lead == 0xF4U) {
      high = 0x8FU;
    }
  } else {
    return 0;
  }
  if (pos + length > input.size()) {
    return 0;
  }
  const unsigned char second = byte_at(pos + 1U);
  if (second < low || second > high) {
    return 0;
  }
  for (std::size_t i = 2; i < length; ++i) {
    const unsigned char next = byte_at(pos + i);
    if (next < 0x80U || next > 0xBFU) {
      return 0;
    }
  }
  return length;
}

} // namespace detail

// Shared JSON string escaping for report exports. Banner bytes and response
// headers arrive straight off the wire, so every control byte is escaped and
// bytes that are not valid UTF-8 become U+FFFD.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (std::size_t pos = 0; pos < input.size(); ++pos) {
    const char ch = input[pos];
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U || as_unsigned == 0x7FU) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else if (as_unsigned < 0x80U) {
        out << ch;
      } else {
        const std::size_t length = detail::Utf8SequenceLength(input, pos);
        if (length == 0U) {
          out << "\\ufffd";
        } else {
          out << input.substr(pos, length);
          pos += length - 1U;
        }
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

} // namespace reconkit::core

#endif // RECONKIT_CORE_JSON_UTILS_HPP_

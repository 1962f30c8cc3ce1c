#ifndef RELPACK_CORE_JSON_UTILS_HPP_
#define RELPACK_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace relpack::core {

// Shared JSON string escaping for events and release records.
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
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
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(as_unsigned));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

inline std::string ToJsonStringArray(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out += ',';
    }
    out += QuoteJson(values[i]);
  }
  out += ']';
  return out;
}

} // namespace relpack::core

#endif // RELPACK_CORE_JSON_UTILS_HPP_

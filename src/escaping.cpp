#include <erlflow/escaping.h>

#include <cstdio>

namespace erlflow {

std::string EscapeJsonString(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      continue;
    case '\\':
      escaped.append("\\\\");
      continue;
    case '\n':
      escaped.append("\\n");
      continue;
    case '\r':
      escaped.append("\\r");
      continue;
    case '\t':
      escaped.append("\\t");
      continue;
    case '\b':
      escaped.append("\\b");
      continue;
    case '\f':
      escaped.append("\\f");
      continue;
    default:
      break;
    }
    const auto code = static_cast<unsigned char>(character);
    if (code < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x", code);
      escaped.append(buffer);
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string JsonString(std::string_view value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string JsonStringArray(const std::vector<std::string> &values) {
  std::string json = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      json.push_back(',');
    }
    json.append(JsonString(values[i]));
  }
  json.push_back(']');
  return json;
}

} // namespace erlflow

#pragma once
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>

// Structured report for a body that failed to parse: 1-based line/column of
// the failing byte plus a window of the text with a caret under it.
inline nlohmann::json describe_parse_error(const std::string &body,
                                           const nlohmann::json::parse_error &e,
                                           std::size_t window = 60) {
  const std::size_t byte = std::min<std::size_t>(e.byte, body.size());

  std::size_t line = 1, col = 1;
  for (std::size_t i = 0; i < byte; ++i) {
    if (body[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }

  const std::size_t start = byte > window ? byte - window : 0;
  const std::size_t end = std::min(body.size(), byte + window);
  std::string context = body.substr(start, end - start);
  context += "\n" + std::string(byte - start, ' ') + "^";

  return {{"ok", false},      {"kind", "parse_error"}, {"what", e.what()},
          {"byte", e.byte},   {"line", line},          {"column", col},
          {"context", context}};
}

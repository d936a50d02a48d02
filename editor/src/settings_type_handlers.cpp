/**
 * @file settings_type_handlers.cpp
 * @brief Text conversion of setting values
 */

#include "McpIDE/editor/settings_type_handlers.hpp"
#include "McpIDE/core/types.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <variant>
#include <vector>

namespace McpIDE::editor {

namespace {

std::string toLowerCopy(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string trimmed(const std::string &str) {
  const auto first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

} // namespace

std::string settingValueToString(const SettingValue &value) {
  if (const auto *b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  if (const auto *i = std::get_if<i32>(&value)) {
    return std::to_string(*i);
  }
  if (const auto *s = std::get_if<std::string>(&value)) {
    return *s;
  }

  const auto &list = std::get<std::vector<std::string>>(value);
  std::string result;
  for (usize idx = 0; idx < list.size(); ++idx) {
    if (idx > 0) {
      result += ", ";
    }
    result += list[idx];
  }
  return result;
}

std::optional<SettingValue> stringToSettingValue(const std::string &str, SettingType type) {
  switch (type) {
  case SettingType::Bool: {
    const std::string lower = toLowerCopy(trimmed(str));
    if (lower == "true" || lower == "1") {
      return SettingValue{true};
    }
    if (lower == "false" || lower == "0") {
      return SettingValue{false};
    }
    return std::nullopt;
  }
  case SettingType::Int:
  case SettingType::IntRange: {
    const std::string text = trimmed(str);
    i32 parsed = 0;
    const char *begin = text.data();
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (text.empty() || ec != std::errc() || ptr != end) {
      return std::nullopt;
    }
    return SettingValue{parsed};
  }
  case SettingType::String:
  case SettingType::Enum:
    return SettingValue{str};
  case SettingType::StringList: {
    std::vector<std::string> items;
    usize start = 0;
    while (start <= str.size()) {
      const usize pos = str.find('\n', start);
      const std::string item =
          str.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
      if (!item.empty()) {
        items.push_back(item);
      }
      if (pos == std::string::npos) {
        break;
      }
      start = pos + 1;
    }
    return SettingValue{std::move(items)};
  }
  }
  return std::nullopt;
}

const char *settingTypeToString(SettingType type) {
  switch (type) {
  case SettingType::Bool:
    return "Bool";
  case SettingType::Int:
    return "Int";
  case SettingType::String:
    return "String";
  case SettingType::Enum:
    return "Enum";
  case SettingType::StringList:
    return "StringList";
  case SettingType::IntRange:
    return "IntRange";
  }
  return "Unknown";
}

} // namespace McpIDE::editor

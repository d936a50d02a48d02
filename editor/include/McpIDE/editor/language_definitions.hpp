#pragma once

/**
 * @file language_definitions.hpp
 * @brief Language detection and lexical tables for syntax highlighting
 *
 * Pure data: detection by file name plus keyword, type and comment tables
 * per language. MISyntaxHighlighter turns a LanguageSpec into rules.
 */

#include "McpIDE/core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace McpIDE::editor {

enum class LanguageId : u8 {
  PlainText,
  Python,
  Cpp,
  C,
  JavaScript,
  TypeScript,
  Json,
  Markdown,
  Shell,
  CMake,
  Html,
  Css,
  Yaml,
  Rust,
  Go,
  Java,
  Ini
};

/**
 * @brief Lexical description of a language
 */
struct LanguageSpec {
  LanguageId id = LanguageId::PlainText;
  std::string displayName;
  std::vector<std::string> keywords;
  std::vector<std::string> types;    // Builtin types and type-like names
  std::vector<std::string> builtins; // Builtin functions and constants
  std::vector<std::string> lineComments;
  std::string blockCommentStart; // Empty when the language has none
  std::string blockCommentEnd;
  std::string stringDelimiters = "\"'";
  bool caseSensitiveKeywords = true;
  bool hasDecorators = false;    // '@name' highlighted as a function
  bool colonOpensBlock = false;  // Trailing ':' starts an indented block
  bool highlightsNumbers = true;
};

/**
 * @brief Detect the language of a file from its name
 * @param fileName File name or full path
 * @return PlainText when nothing matches
 */
[[nodiscard]] LanguageId detectLanguage(std::string_view fileName);

/**
 * @brief User-facing language name ("Python", "C++", "Text", ...)
 */
[[nodiscard]] const char *languageDisplayName(LanguageId id);

/**
 * @brief Lexical tables for a language
 */
[[nodiscard]] const LanguageSpec &languageSpec(LanguageId id);

} // namespace McpIDE::editor

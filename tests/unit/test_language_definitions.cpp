/**
 * @file test_language_definitions.cpp
 * @brief Tests for language detection and lexical tables
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/language_definitions.hpp"

#include <algorithm>
#include <string>

using namespace McpIDE::editor;

namespace {

bool containsWord(const std::vector<std::string> &words, const std::string &word) {
  return std::find(words.begin(), words.end(), word) != words.end();
}

} // namespace

TEST_CASE("Language detection - By extension", "[language]") {
  CHECK(detectLanguage("main.py") == LanguageId::Python);
  CHECK(detectLanguage("widget.cpp") == LanguageId::Cpp);
  CHECK(detectLanguage("widget.hpp") == LanguageId::Cpp);
  CHECK(detectLanguage("legacy.c") == LanguageId::C);
  CHECK(detectLanguage("app.js") == LanguageId::JavaScript);
  CHECK(detectLanguage("app.tsx") == LanguageId::TypeScript);
  CHECK(detectLanguage("package.json") == LanguageId::Json);
  CHECK(detectLanguage("README.md") == LanguageId::Markdown);
  CHECK(detectLanguage("build.sh") == LanguageId::Shell);
  CHECK(detectLanguage("index.html") == LanguageId::Html);
  CHECK(detectLanguage("theme.css") == LanguageId::Css);
  CHECK(detectLanguage("ci.yml") == LanguageId::Yaml);
  CHECK(detectLanguage("lib.rs") == LanguageId::Rust);
  CHECK(detectLanguage("server.go") == LanguageId::Go);
  CHECK(detectLanguage("Main.java") == LanguageId::Java);
  CHECK(detectLanguage("setup.cfg") == LanguageId::Ini);
}

TEST_CASE("Language detection - Paths, case and special names", "[language]") {
  SECTION("Directories are ignored") {
    CHECK(detectLanguage("/home/user/project.d/src/main.py") == LanguageId::Python);
    CHECK(detectLanguage("C:\\work\\tool.cpp") == LanguageId::Cpp);
  }

  SECTION("Extension case does not matter") {
    CHECK(detectLanguage("SCRIPT.PY") == LanguageId::Python);
  }

  SECTION("Well-known file names") {
    CHECK(detectLanguage("CMakeLists.txt") == LanguageId::CMake);
    CHECK(detectLanguage("/repo/Makefile") == LanguageId::Shell);
    CHECK(detectLanguage(".bashrc") == LanguageId::Shell);
  }

  SECTION("Unknown and empty names are plain text") {
    CHECK(detectLanguage("") == LanguageId::PlainText);
    CHECK(detectLanguage("notes") == LanguageId::PlainText);
    CHECK(detectLanguage("archive.xyz") == LanguageId::PlainText);
    CHECK(detectLanguage("trailing.") == LanguageId::PlainText);
    CHECK(detectLanguage("/some/dir/") == LanguageId::PlainText);
  }
}

TEST_CASE("Language tables - Display names", "[language]") {
  CHECK(std::string(languageDisplayName(LanguageId::Python)) == "Python");
  CHECK(std::string(languageDisplayName(LanguageId::Cpp)) == "C++");
  CHECK(std::string(languageDisplayName(LanguageId::Json)) == "JSON");
  CHECK(std::string(languageDisplayName(LanguageId::PlainText)) == "Text");
}

TEST_CASE("Language tables - Lexical content", "[language]") {
  SECTION("Python") {
    const auto &spec = languageSpec(LanguageId::Python);
    CHECK(containsWord(spec.keywords, "def"));
    CHECK(containsWord(spec.keywords, "lambda"));
    CHECK(containsWord(spec.builtins, "print"));
    CHECK(containsWord(spec.lineComments, "#"));
    CHECK(spec.hasDecorators);
    CHECK(spec.colonOpensBlock);
    CHECK(spec.blockCommentStart.empty());
  }

  SECTION("C++ extends the C family") {
    const auto &spec = languageSpec(LanguageId::Cpp);
    CHECK(containsWord(spec.keywords, "while"));
    CHECK(containsWord(spec.keywords, "class"));
    CHECK(containsWord(spec.builtins, "nullptr"));
    CHECK(spec.blockCommentStart == "/*");
    CHECK(spec.blockCommentEnd == "*/");
  }

  SECTION("JSON has only literals and double quotes") {
    const auto &spec = languageSpec(LanguageId::Json);
    CHECK(spec.keywords.empty());
    CHECK(spec.stringDelimiters == "\"");
    CHECK(spec.lineComments.empty());
  }

  SECTION("Every language has a spec with a matching id") {
    const LanguageId languages[] = {
        LanguageId::PlainText, LanguageId::Python,     LanguageId::Cpp,  LanguageId::C,
        LanguageId::JavaScript, LanguageId::TypeScript, LanguageId::Json, LanguageId::Markdown,
        LanguageId::Shell,     LanguageId::CMake,      LanguageId::Html, LanguageId::Css,
        LanguageId::Yaml,      LanguageId::Rust,       LanguageId::Go,   LanguageId::Java,
        LanguageId::Ini};
    for (LanguageId id : languages) {
      CHECK(languageSpec(id).id == id);
      CHECK_FALSE(languageSpec(id).displayName.empty());
    }
  }
}

/**
 * @file test_syntax_highlighter.cpp
 * @brief Tests for rule based highlighting over a QTextDocument
 */

#include <catch2/catch_test_macros.hpp>

#include "McpIDE/editor/qt/mi_syntax_highlighter.hpp"

#include <QApplication>
#include <QTextBlock>
#include <QTextDocument>
#include <QTextLayout>
#include <optional>

using namespace McpIDE::editor;
using namespace McpIDE::editor::qt;

namespace {

void ensureQtApp() {
  if (!QApplication::instance()) {
    static int argc = 1;
    static char arg0[] = "integration_tests";
    static char *argv[] = {arg0, nullptr};
    new QApplication(argc, argv);
  }
}

std::optional<QTextCharFormat> formatAt(const QTextBlock &block, int position) {
  std::optional<QTextCharFormat> found;
  for (const auto &range : block.layout()->formats()) {
    if (position >= range.start && position < range.start + range.length) {
      found = range.format;
    }
  }
  return found;
}

bool hasColor(const QTextBlock &block, int position, const QColor &color) {
  auto format = formatAt(block, position);
  return format && format->foreground().color() == color;
}

} // namespace

TEST_CASE("MISyntaxHighlighter - Token colors", "[syntax_highlighter]") {
  const QColor dark = MISyntaxHighlighter::tokenColor(MIToken::Keyword, Theme::Dark);
  const QColor light = MISyntaxHighlighter::tokenColor(MIToken::Keyword, Theme::Light);
  CHECK(dark == QColor(198, 120, 221));
  CHECK(light.lightness() < dark.lightness());
  CHECK(light == QColor(139, 84, 155));
}

TEST_CASE("MISyntaxHighlighter - Language selection", "[syntax_highlighter]") {
  ensureQtApp();
  QTextDocument document;
  MISyntaxHighlighter highlighter(&document);

  CHECK(highlighter.language() == LanguageId::PlainText);
  highlighter.setLanguageFromFileName("/work/src/main.py");
  CHECK(highlighter.language() == LanguageId::Python);
  highlighter.setLanguageFromFileName("widget.cpp");
  CHECK(highlighter.language() == LanguageId::Cpp);
  highlighter.setLanguageFromFileName("notes");
  CHECK(highlighter.language() == LanguageId::PlainText);
}

TEST_CASE("MISyntaxHighlighter - Python tokens", "[syntax_highlighter]") {
  ensureQtApp();
  QTextDocument document;
  MISyntaxHighlighter highlighter(&document);
  highlighter.setTheme(Theme::Dark);
  highlighter.setLanguage(LanguageId::Python);

  document.setPlainText("def load(path): # read it\n"
                        "name = \"a # b\"\n"
                        "count = 42\n"
                        "@property");
  highlighter.rehighlight();

  const QTextBlock first = document.firstBlock();
  const QTextBlock second = first.next();
  const QTextBlock third = second.next();
  const QTextBlock fourth = third.next();

  SECTION("Keyword") {
    CHECK(hasColor(first, 0, MISyntaxHighlighter::tokenColor(MIToken::Keyword, Theme::Dark)));
    auto format = formatAt(first, 0);
    REQUIRE(format.has_value());
    CHECK(format->fontWeight() == QFont::Bold);
  }

  SECTION("Function call") {
    CHECK(hasColor(first, 4, MISyntaxHighlighter::tokenColor(MIToken::Function, Theme::Dark)));
  }

  SECTION("Comment runs to end of line") {
    const int hash = static_cast<int>(first.text().indexOf('#'));
    CHECK(hasColor(first, hash, MISyntaxHighlighter::tokenColor(MIToken::Comment, Theme::Dark)));
    CHECK(hasColor(first, static_cast<int>(first.text().size()) - 1,
                   MISyntaxHighlighter::tokenColor(MIToken::Comment, Theme::Dark)));
  }

  SECTION("Comment marker inside a string stays a string") {
    const int hash = static_cast<int>(second.text().indexOf('#'));
    CHECK(hasColor(second, hash, MISyntaxHighlighter::tokenColor(MIToken::String, Theme::Dark)));
  }

  SECTION("Number") {
    const int digits = static_cast<int>(third.text().indexOf("42"));
    CHECK(hasColor(third, digits, MISyntaxHighlighter::tokenColor(MIToken::Number, Theme::Dark)));
  }

  SECTION("Decorator") {
    CHECK(hasColor(fourth, 1, MISyntaxHighlighter::tokenColor(MIToken::Function, Theme::Dark)));
  }
}

TEST_CASE("MISyntaxHighlighter - Block comments span lines", "[syntax_highlighter]") {
  ensureQtApp();
  QTextDocument document;
  MISyntaxHighlighter highlighter(&document);
  highlighter.setTheme(Theme::Dark);
  highlighter.setLanguage(LanguageId::Cpp);

  document.setPlainText("/* first\n"
                        "middle\n"
                        "end */ x = 1;");
  highlighter.rehighlight();

  const QColor comment = MISyntaxHighlighter::tokenColor(MIToken::Comment, Theme::Dark);
  const QTextBlock first = document.firstBlock();
  const QTextBlock middle = first.next();
  const QTextBlock last = middle.next();

  CHECK(first.userState() == 1);
  CHECK(middle.userState() == 1);
  CHECK(last.userState() == 0);
  CHECK(hasColor(middle, 0, comment));
  CHECK(hasColor(last, 4, comment));
  CHECK_FALSE(hasColor(last, static_cast<int>(last.text().indexOf('1')), comment));
}

TEST_CASE("MISyntaxHighlighter - Plain text and theme switch", "[syntax_highlighter]") {
  ensureQtApp();
  QTextDocument document;
  MISyntaxHighlighter highlighter(&document);

  SECTION("Plain text gets no formats") {
    document.setPlainText("def if while 42");
    highlighter.rehighlight();
    CHECK(document.firstBlock().layout()->formats().isEmpty());
  }

  SECTION("Switching theme recolors tokens") {
    highlighter.setLanguage(LanguageId::Python);
    document.setPlainText("return");
    highlighter.setTheme(Theme::Light);
    CHECK(highlighter.theme() == Theme::Light);
    CHECK(hasColor(document.firstBlock(), 0,
                   MISyntaxHighlighter::tokenColor(MIToken::Keyword, Theme::Light)));
  }
}

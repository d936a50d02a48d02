#pragma once

/**
 * @file mi_syntax_highlighter.hpp
 * @brief Rule based syntax highlighter driven by LanguageSpec tables
 */

#include "McpIDE/editor/language_definitions.hpp"
#include "McpIDE/editor/qt/mi_style_manager.hpp"

#include <QRegularExpression>
#include <QSyntaxHighlighter>
#include <QTextCharFormat>
#include <QVector>
#include <array>

namespace McpIDE::editor::qt {

/**
 * @brief Token categories with their own format
 */
enum class MIToken { Keyword, Type, Function, Number, Operator, String, Comment };

class MISyntaxHighlighter final : public QSyntaxHighlighter {
  Q_OBJECT

public:
  explicit MISyntaxHighlighter(QTextDocument *parent = nullptr);

  void setLanguage(LanguageId language);

  /**
   * @brief Select the language from a file name or path
   */
  void setLanguageFromFileName(const QString &fileName);

  [[nodiscard]] LanguageId language() const { return m_language; }

  /**
   * @brief Rebuild token formats for a theme and rehighlight
   */
  void setTheme(Theme theme);
  [[nodiscard]] Theme theme() const { return m_theme; }

  /**
   * @brief Token color; the light theme uses a 30% darker shade
   */
  [[nodiscard]] static QColor tokenColor(MIToken token, Theme theme);

  [[nodiscard]] QTextCharFormat tokenFormat(MIToken token) const;

protected:
  void highlightBlock(const QString &text) override;

private:
  struct Rule {
    QRegularExpression pattern;
    MIToken token;
  };

  static constexpr int kInBlockComment = 1;

  void rebuildFormats();
  void rebuildRules();

  /**
   * @brief Format strings and comments in one left to right pass so a
   *        comment marker inside a string (and vice versa) is ignored
   */
  void highlightStringsAndComments(const QString &text);
  void formatString(const QString &text, int start, int length);

  LanguageId m_language = LanguageId::PlainText;
  Theme m_theme = Theme::Dark;
  QVector<Rule> m_rules;
  std::array<QTextCharFormat, 7> m_formats;
  QRegularExpression m_escapePattern;
};

} // namespace McpIDE::editor::qt

#pragma once

/**
 * @file mi_code_editor.hpp
 * @brief Plain text code editor with line numbers, highlighting and search
 */

#include "McpIDE/core/result.hpp"
#include "McpIDE/editor/qt/mi_syntax_highlighter.hpp"

#include <QList>
#include <QPlainTextEdit>
#include <QString>
#include <QTextCursor>
#include <QTextDocument>
#include <QTextEdit>
#include <optional>

class QKeyEvent;
class QPaintEvent;
class QResizeEvent;
class QDragEnterEvent;
class QDropEvent;

namespace McpIDE::editor::qt {

class MIAppSettings;

class MICodeEditor final : public QPlainTextEdit {
  Q_OBJECT

public:
  /**
   * @param settings Editor preferences; null means built-in defaults
   */
  explicit MICodeEditor(MIAppSettings *settings = nullptr, QWidget *parent = nullptr);
  ~MICodeEditor() override = default;

  // =========================================================================
  // File
  // =========================================================================

  [[nodiscard]] QString filePath() const { return m_filePath; }

  /**
   * @brief Set the backing path and pick the highlighter language from it
   */
  void setFilePath(const QString &path);

  /**
   * @brief File name of the backing path, or "Untitled"
   */
  [[nodiscard]] QString displayName() const;

  /**
   * @brief Load a file as strict UTF-8
   */
  Result<void> loadFile(const QString &path);

  /**
   * @brief Save atomically as UTF-8
   * @param path Target path; the current path when empty
   */
  Result<void> saveFile(const QString &path = QString());

  [[nodiscard]] bool isModified() const { return document()->isModified(); }

  [[nodiscard]] MISyntaxHighlighter *highlighter() const { return m_highlighter; }
  [[nodiscard]] LanguageId language() const { return m_highlighter->language(); }

  // =========================================================================
  // Search
  // =========================================================================

  /**
   * @brief Find the next match from the cursor and select it
   *
   * Wraps to the start (or the end when searching backward) once.
   */
  bool findText(const QString &text, bool caseSensitive = false, bool wholeWords = false,
                bool regex = false, bool forward = true);

  /**
   * @brief Replace the selection if it matches, else the next match
   */
  bool replaceText(const QString &find, const QString &replacement, bool caseSensitive = false,
                   bool wholeWords = false, bool regex = false);

  /**
   * @brief Replace every match in one undo step
   * @return Number of replacements
   */
  int replaceAll(const QString &find, const QString &replacement, bool caseSensitive = false,
                 bool wholeWords = false, bool regex = false);

  /**
   * @brief Count non-overlapping, non-empty matches
   */
  [[nodiscard]] int countMatches(const QString &find, bool caseSensitive = false,
                                 bool wholeWords = false, bool regex = false) const;

  void setSearchHighlights(const QList<QTextEdit::ExtraSelection> &selections);
  void clearSearchHighlights();

  // =========================================================================
  // Layout
  // =========================================================================

  [[nodiscard]] int lineNumberAreaWidth() const;
  void lineNumberAreaPaintEvent(QPaintEvent *event);

  [[nodiscard]] int tabSize() const;
  [[nodiscard]] bool useSpaces() const;

  /**
   * @brief Re-read font, tab stop, wrap mode and theme from settings
   */
  void applySettings();

signals:
  void cursorPositionChanged(int line, int column);
  void fileDropped(const QString &path);
  void searchFinished(bool found);
  void filePathChanged(const QString &path);
  void modificationStateChanged(bool modified);

protected:
  void keyPressEvent(QKeyEvent *event) override;
  void resizeEvent(QResizeEvent *event) override;
  void dragEnterEvent(QDragEnterEvent *event) override;
  void dropEvent(QDropEvent *event) override;
  void changeEvent(QEvent *event) override;

private slots:
  void updateLineNumberAreaWidth(int newBlockCount);
  void updateLineNumberArea(const QRect &rect, int dy);
  void highlightCurrentLine();
  void emitCursorPosition();
  void applyTheme();

private:
  struct SearchQuery {
    QString text;
    QTextDocument::FindFlags flags;
    std::optional<QRegularExpression> pattern;
  };

  /**
   * @brief Build a query; nullopt for an invalid regular expression
   */
  [[nodiscard]] static std::optional<SearchQuery> makeQuery(const QString &text,
                                                            bool caseSensitive, bool wholeWords,
                                                            bool regex, bool forward);
  /// Next non-empty match in the query's direction; zero-length regex matches are stepped over
  [[nodiscard]] QTextCursor findFrom(const QTextCursor &from, const SearchQuery &query) const;
  [[nodiscard]] static bool selectionMatches(const QString &selected, const QString &find,
                                             bool caseSensitive, bool regex);

  void handleReturnKey();
  void handleTabKey(QKeyEvent *event);
  void handleBacktabKey();
  [[nodiscard]] QString indentUnit() const;

  MIAppSettings *m_settings = nullptr;
  QWidget *m_lineNumberArea = nullptr;
  MISyntaxHighlighter *m_highlighter = nullptr;
  QString m_filePath;
  QList<QTextEdit::ExtraSelection> m_searchHighlights;
};

} // namespace McpIDE::editor::qt

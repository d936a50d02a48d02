#include "McpIDE/editor/qt/mi_code_editor.hpp"
#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_style_manager.hpp"

#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFile>
#include <QFileInfo>
#include <QFontDatabase>
#include <QKeyEvent>
#include <QMimeData>
#include <QPainter>
#include <QSaveFile>
#include <QStringDecoder>
#include <QTextBlock>
#include <QUrl>
#include <algorithm>

namespace McpIDE::editor::qt {

namespace {

class MILineNumberArea : public QWidget {
public:
  explicit MILineNumberArea(MICodeEditor *editor) : QWidget(editor), m_editor(editor) {}

  [[nodiscard]] QSize sizeHint() const override {
    return QSize(m_editor->lineNumberAreaWidth(), 0);
  }

protected:
  void paintEvent(QPaintEvent *event) override { m_editor->lineNumberAreaPaintEvent(event); }

private:
  MICodeEditor *m_editor = nullptr;
};

int leadingWhitespace(const QString &text) {
  int leading = 0;
  while (leading < text.size() && (text.at(leading) == ' ' || text.at(leading) == '\t')) {
    ++leading;
  }
  return leading;
}

} // namespace

MICodeEditor::MICodeEditor(MIAppSettings *settings, QWidget *parent)
    : QPlainTextEdit(parent), m_settings(settings) {
  setObjectName("MICodeEditor");
  setCursorWidth(2);
  setPlaceholderText(tr("Type your code here..."));
  setAcceptDrops(true);

  m_lineNumberArea = new MILineNumberArea(this);
  m_highlighter = new MISyntaxHighlighter(document());

  connect(this, &QPlainTextEdit::blockCountChanged, this,
          &MICodeEditor::updateLineNumberAreaWidth);
  connect(this, &QPlainTextEdit::updateRequest, this, &MICodeEditor::updateLineNumberArea);
  connect(this, &QPlainTextEdit::cursorPositionChanged, this,
          &MICodeEditor::highlightCurrentLine);
  connect(this, &QPlainTextEdit::cursorPositionChanged, this,
          &MICodeEditor::emitCursorPosition);
  connect(document(), &QTextDocument::modificationChanged, this,
          &MICodeEditor::modificationStateChanged);

  connect(&MIStyleManager::instance(), &MIStyleManager::themeChanged, this,
          &MICodeEditor::applyTheme);
  if (m_settings) {
    connect(m_settings, &MIAppSettings::editorFontChanged, this,
            [this](const QString &, int) { applySettings(); });
    connect(m_settings, &MIAppSettings::settingChanged, this, [this](const QString &key) {
      if (key == "tab_size" || key == "word_wrap" || key == "show_line_numbers") {
        applySettings();
      }
    });
  }

  applySettings();
  applyTheme();
}

// ============================================================================
// Settings and theme
// ============================================================================

int MICodeEditor::tabSize() const { return m_settings ? m_settings->tabSize() : 4; }

bool MICodeEditor::useSpaces() const { return m_settings ? m_settings->useSpaces() : true; }

QString MICodeEditor::indentUnit() const {
  return useSpaces() ? QString(tabSize(), ' ') : QString("\t");
}

void MICodeEditor::applySettings() {
  QFont font = MIStyleManager::instance().monospaceFont();
  if (m_settings) {
    font.setFamily(m_settings->fontFamily());
    font.setPointSize(m_settings->fontSize());
  }
  font.setFixedPitch(true);
  font.setStyleHint(QFont::Monospace);
  setFont(font);

  setTabStopDistance(fontMetrics().horizontalAdvance(' ') * tabSize());

  const bool wrap = m_settings && m_settings->wordWrap();
  setLineWrapMode(wrap ? QPlainTextEdit::WidgetWidth : QPlainTextEdit::NoWrap);

  updateLineNumberAreaWidth(0);
  m_lineNumberArea->setVisible(lineNumberAreaWidth() > 0);
  m_lineNumberArea->update();
}

void MICodeEditor::applyTheme() {
  m_highlighter->setTheme(MIStyleManager::instance().currentTheme());
  highlightCurrentLine();
  m_lineNumberArea->update();
  viewport()->update();
}

void MICodeEditor::changeEvent(QEvent *event) {
  QPlainTextEdit::changeEvent(event);
  if (event->type() == QEvent::FontChange) {
    updateLineNumberAreaWidth(0);
  }
}

// ============================================================================
// File
// ============================================================================

void MICodeEditor::setFilePath(const QString &path) {
  m_filePath = path;
  m_highlighter->setLanguageFromFileName(path);
  emit filePathChanged(path);
}

QString MICodeEditor::displayName() const {
  if (m_filePath.isEmpty()) {
    return tr("Untitled");
  }
  return QFileInfo(m_filePath).fileName();
}

Result<void> MICodeEditor::loadFile(const QString &path) {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    return Result<void>::error("Cannot read " + path.toStdString() + ": " +
                               file.errorString().toStdString());
  }
  const QByteArray bytes = file.readAll();
  if (file.error() != QFileDevice::NoError) {
    return Result<void>::error("Cannot read " + path.toStdString() + ": " +
                               file.errorString().toStdString());
  }

  QStringDecoder decoder(QStringDecoder::Utf8);
  const QString text = decoder.decode(bytes);
  if (decoder.hasError()) {
    return Result<void>::error(path.toStdString() + " is not valid UTF-8 text");
  }

  setPlainText(text);
  setFilePath(path);
  document()->setModified(false);
  MCPIDE_LOG_DEBUG("Loaded {} ({} bytes)", path.toStdString(), bytes.size());
  return Result<void>::ok();
}

Result<void> MICodeEditor::saveFile(const QString &path) {
  const QString target = path.isEmpty() ? m_filePath : path;
  if (target.isEmpty()) {
    return Result<void>::error("No file path to save to");
  }

  QSaveFile file(target);
  if (!file.open(QIODevice::WriteOnly)) {
    return Result<void>::error("Cannot write " + target.toStdString() + ": " +
                               file.errorString().toStdString());
  }
  const QByteArray bytes = toPlainText().toUtf8();
  if (file.write(bytes) != bytes.size()) {
    const std::string reason = file.errorString().toStdString();
    file.cancelWriting();
    return Result<void>::error("Cannot write " + target.toStdString() + ": " + reason);
  }
  if (!file.commit()) {
    return Result<void>::error("Cannot write " + target.toStdString() + ": " +
                               file.errorString().toStdString());
  }

  if (target != m_filePath) {
    setFilePath(target);
  }
  document()->setModified(false);
  MCPIDE_LOG_DEBUG("Saved {}", target.toStdString());
  return Result<void>::ok();
}

// ============================================================================
// Search
// ============================================================================

std::optional<MICodeEditor::SearchQuery> MICodeEditor::makeQuery(const QString &text,
                                                                 bool caseSensitive,
                                                                 bool wholeWords, bool regex,
                                                                 bool forward) {
  SearchQuery query;
  query.text = text;
  if (caseSensitive) {
    query.flags |= QTextDocument::FindCaseSensitively;
  }
  if (!forward) {
    query.flags |= QTextDocument::FindBackward;
  }

  if (regex) {
    // Word boundaries are part of the pattern for regex searches
    const QString pattern = wholeWords ? QString("\\b(?:%1)\\b").arg(text) : text;
    QRegularExpression expression(pattern);
    if (!caseSensitive) {
      expression.setPatternOptions(QRegularExpression::CaseInsensitiveOption);
    }
    if (!expression.isValid()) {
      return std::nullopt;
    }
    query.pattern = expression;
  } else if (wholeWords) {
    query.flags |= QTextDocument::FindWholeWords;
  }
  return query;
}

QTextCursor MICodeEditor::findFrom(const QTextCursor &from, const SearchQuery &query) const {
  const int step = query.flags.testFlag(QTextDocument::FindBackward) ? -1 : 1;
  QTextCursor position = from;
  while (true) {
    QTextCursor found = query.pattern ? document()->find(*query.pattern, position, query.flags)
                                      : document()->find(query.text, position, query.flags);
    if (found.isNull() || found.hasSelection()) {
      return found;
    }

    const int next = found.position() + step;
    if (next < 0 || next >= document()->characterCount()) {
      return QTextCursor();
    }
    position = QTextCursor(document());
    position.setPosition(next);
  }
}

bool MICodeEditor::selectionMatches(const QString &selected, const QString &find,
                                    bool caseSensitive, bool regex) {
  if (selected.isEmpty()) {
    return false;
  }
  if (regex) {
    QRegularExpression expression(QRegularExpression::anchoredPattern(find));
    if (!caseSensitive) {
      expression.setPatternOptions(QRegularExpression::CaseInsensitiveOption);
    }
    return expression.isValid() && expression.match(selected).hasMatch();
  }
  return selected.compare(find, caseSensitive ? Qt::CaseSensitive : Qt::CaseInsensitive) == 0;
}

bool MICodeEditor::findText(const QString &text, bool caseSensitive, bool wholeWords, bool regex,
                            bool forward) {
  const auto query = makeQuery(text, caseSensitive, wholeWords, regex, forward);
  if (text.isEmpty() || !query) {
    emit searchFinished(false);
    return false;
  }

  QTextCursor found = findFrom(textCursor(), *query);
  if (found.isNull()) {
    QTextCursor wrapped = textCursor();
    wrapped.movePosition(forward ? QTextCursor::Start : QTextCursor::End);
    found = findFrom(wrapped, *query);
  }

  if (found.isNull()) {
    emit searchFinished(false);
    return false;
  }

  setTextCursor(found);
  centerCursor();
  emit searchFinished(true);
  return true;
}

bool MICodeEditor::replaceText(const QString &find, const QString &replacement,
                               bool caseSensitive, bool wholeWords, bool regex) {
  QTextCursor cursor = textCursor();
  if (!selectionMatches(cursor.selectedText(), find, caseSensitive, regex)) {
    if (!findText(find, caseSensitive, wholeWords, regex, true)) {
      return false;
    }
    cursor = textCursor();
  }

  cursor.insertText(replacement);
  setTextCursor(cursor);
  return true;
}

int MICodeEditor::replaceAll(const QString &find, const QString &replacement, bool caseSensitive,
                             bool wholeWords, bool regex) {
  const auto query = makeQuery(find, caseSensitive, wholeWords, regex, true);
  if (find.isEmpty() || !query) {
    return 0;
  }

  const int originalPosition = textCursor().position();

  QTextCursor editCursor(document());
  editCursor.beginEditBlock();

  int count = 0;
  QTextCursor searchFrom(document());
  while (true) {
    const QTextCursor found = findFrom(searchFrom, *query);
    if (found.isNull()) {
      break;
    }

    editCursor.setPosition(found.selectionStart());
    editCursor.setPosition(found.selectionEnd(), QTextCursor::KeepAnchor);
    editCursor.insertText(replacement);
    ++count;

    // Continue after the inserted text so it is never rescanned
    searchFrom.setPosition(editCursor.position());
  }

  editCursor.endEditBlock();

  QTextCursor restored = textCursor();
  restored.setPosition(std::min(originalPosition, document()->characterCount() - 1));
  setTextCursor(restored);

  MCPIDE_LOG_DEBUG("Replaced {} occurrence(s) in {}", count, displayName().toStdString());
  return count;
}

int MICodeEditor::countMatches(const QString &find, bool caseSensitive, bool wholeWords,
                               bool regex) const {
  const auto query = makeQuery(find, caseSensitive, wholeWords, regex, true);
  if (find.isEmpty() || !query) {
    return 0;
  }

  int count = 0;
  QTextCursor searchFrom(document());
  while (true) {
    const QTextCursor found = findFrom(searchFrom, *query);
    if (found.isNull()) {
      break;
    }
    ++count;
    searchFrom.setPosition(found.selectionEnd());
  }
  return count;
}

void MICodeEditor::setSearchHighlights(const QList<QTextEdit::ExtraSelection> &selections) {
  m_searchHighlights = selections;
  highlightCurrentLine();
}

void MICodeEditor::clearSearchHighlights() {
  m_searchHighlights.clear();
  highlightCurrentLine();
}

// ============================================================================
// Keys
// ============================================================================

void MICodeEditor::keyPressEvent(QKeyEvent *event) {
  const Qt::KeyboardModifiers mods = event->modifiers();

  if (event->key() == Qt::Key_Tab && !(mods & (Qt::ControlModifier | Qt::ShiftModifier))) {
    handleTabKey(event);
    return;
  }

  if (event->key() == Qt::Key_Backtab ||
      (event->key() == Qt::Key_Tab && (mods & Qt::ShiftModifier))) {
    handleBacktabKey();
    event->accept();
    return;
  }

  if ((event->key() == Qt::Key_Return || event->key() == Qt::Key_Enter) &&
      !(mods & (Qt::ControlModifier | Qt::ShiftModifier))) {
    handleReturnKey();
    event->accept();
    return;
  }

  QPlainTextEdit::keyPressEvent(event);
}

void MICodeEditor::handleReturnKey() {
  QTextCursor cursor = textCursor();
  const QString line = cursor.block().text();
  QString indent = line.left(leadingWhitespace(line));

  // Python style block opener; applied regardless of language
  const QString beforeCursor = line.left(cursor.positionInBlock()).trimmed();
  if (beforeCursor.endsWith(':')) {
    indent += indentUnit();
  }

  cursor.insertText("\n" + indent);
  setTextCursor(cursor);
}

void MICodeEditor::handleTabKey(QKeyEvent *event) {
  if (!useSpaces()) {
    QPlainTextEdit::keyPressEvent(event);
    return;
  }
  textCursor().insertText(QString(tabSize(), ' '));
  event->accept();
}

void MICodeEditor::handleBacktabKey() {
  QTextCursor cursor = textCursor();
  const QString line = cursor.block().text();

  int removable = 0;
  if (!line.isEmpty() && line.at(0) == '\t') {
    removable = 1;
  } else {
    while (removable < tabSize() && removable < line.size() && line.at(removable) == ' ') {
      ++removable;
    }
  }
  if (removable == 0) {
    return;
  }

  cursor.beginEditBlock();
  cursor.movePosition(QTextCursor::StartOfBlock);
  cursor.movePosition(QTextCursor::Right, QTextCursor::KeepAnchor, removable);
  cursor.removeSelectedText();
  cursor.endEditBlock();
}

// ============================================================================
// Drag and drop
// ============================================================================

void MICodeEditor::dragEnterEvent(QDragEnterEvent *event) {
  if (event->mimeData()->hasUrls()) {
    event->acceptProposedAction();
    return;
  }
  QPlainTextEdit::dragEnterEvent(event);
}

void MICodeEditor::dropEvent(QDropEvent *event) {
  const QMimeData *mime = event->mimeData();
  if (!mime->hasUrls()) {
    QPlainTextEdit::dropEvent(event);
    return;
  }

  bool handled = false;
  for (const QUrl &url : mime->urls()) {
    if (url.isLocalFile() && QFileInfo(url.toLocalFile()).isFile()) {
      emit fileDropped(url.toLocalFile());
      handled = true;
    }
  }
  if (handled) {
    event->acceptProposedAction();
  } else {
    QPlainTextEdit::dropEvent(event);
  }
}

// ============================================================================
// Line numbers and current line
// ============================================================================

int MICodeEditor::lineNumberAreaWidth() const {
  if (m_settings && !m_settings->showLineNumbers()) {
    return 0;
  }
  int digits = 1;
  int max = std::max(1, blockCount());
  while (max >= 10) {
    max /= 10;
    ++digits;
  }
  return 3 + fontMetrics().horizontalAdvance(QLatin1Char('9')) * digits;
}

void MICodeEditor::updateLineNumberAreaWidth(int newBlockCount) {
  Q_UNUSED(newBlockCount);
  setViewportMargins(lineNumberAreaWidth(), 0, 0, 0);
}

void MICodeEditor::updateLineNumberArea(const QRect &rect, int dy) {
  if (dy) {
    m_lineNumberArea->scroll(0, dy);
  } else {
    m_lineNumberArea->update(0, rect.y(), m_lineNumberArea->width(), rect.height());
  }

  if (rect.contains(viewport()->rect())) {
    updateLineNumberAreaWidth(0);
  }
}

void MICodeEditor::resizeEvent(QResizeEvent *event) {
  QPlainTextEdit::resizeEvent(event);
  const QRect cr = contentsRect();
  m_lineNumberArea->setGeometry(QRect(cr.left(), cr.top(), lineNumberAreaWidth(), cr.height()));
}

void MICodeEditor::lineNumberAreaPaintEvent(QPaintEvent *event) {
  auto &style = MIStyleManager::instance();
  const auto &palette = style.palette();

  QPainter painter(m_lineNumberArea);
  painter.fillRect(event->rect(), palette.sidebar);

  const int currentBlock = textCursor().blockNumber();
  const QColor currentColor =
      style.currentTheme() == Theme::Dark ? QColor(Qt::white) : QColor(Qt::black);
  QFont boldFont = font();
  boldFont.setBold(true);

  QTextBlock block = firstVisibleBlock();
  int blockNumber = block.blockNumber();
  int top = static_cast<int>(blockBoundingGeometry(block).translated(contentOffset()).top());
  int bottom = top + static_cast<int>(blockBoundingRect(block).height());

  while (block.isValid() && top <= event->rect().bottom()) {
    if (block.isVisible() && bottom >= event->rect().top()) {
      const bool isCurrent = (blockNumber == currentBlock);
      painter.setFont(isCurrent ? boldFont : font());
      painter.setPen(isCurrent ? currentColor : palette.lineNumber);
      painter.drawText(0, top, m_lineNumberArea->width() - 2, fontMetrics().height(),
                       Qt::AlignRight, QString::number(blockNumber + 1));
    }

    block = block.next();
    top = bottom;
    bottom = top + static_cast<int>(blockBoundingRect(block).height());
    ++blockNumber;
  }
}

void MICodeEditor::highlightCurrentLine() {
  QList<QTextEdit::ExtraSelection> selections;

  if (!isReadOnly()) {
    QTextEdit::ExtraSelection selection;
    selection.format.setBackground(MIStyleManager::instance().palette().currentLine);
    selection.format.setProperty(QTextFormat::FullWidthSelection, true);
    selection.cursor = textCursor();
    selection.cursor.clearSelection();
    selections.append(selection);
  }

  selections.append(m_searchHighlights);
  setExtraSelections(selections);
  m_lineNumberArea->update();
}

void MICodeEditor::emitCursorPosition() {
  const QTextCursor cursor = textCursor();
  emit cursorPositionChanged(cursor.blockNumber() + 1, cursor.positionInBlock() + 1);
}

} // namespace McpIDE::editor::qt

#include "McpIDE/editor/qt/mi_syntax_highlighter.hpp"

#include <QFileInfo>
#include <QStringList>
#include <QStringView>
#include <algorithm>
#include <cmath>

namespace McpIDE::editor::qt {

namespace {

int tokenIndex(MIToken token) { return static_cast<int>(token); }

QString alternation(const std::vector<std::string> &words) {
  QStringList escaped;
  escaped.reserve(static_cast<qsizetype>(words.size()));
  for (const auto &word : words) {
    escaped.append(QRegularExpression::escape(QString::fromStdString(word)));
  }
  return escaped.join('|');
}

QRegularExpression wordListPattern(const std::vector<std::string> &words, bool caseSensitive) {
  QRegularExpression::PatternOptions options = QRegularExpression::NoPatternOption;
  if (!caseSensitive) {
    options |= QRegularExpression::CaseInsensitiveOption;
  }
  return QRegularExpression(QString("\\b(?:%1)\\b").arg(alternation(words)), options);
}

QColor darken(const QColor &color) {
  auto scale = [](int channel) { return static_cast<int>(std::lround(channel * 0.7)); };
  return QColor(scale(color.red()), scale(color.green()), scale(color.blue()));
}

} // namespace

MISyntaxHighlighter::MISyntaxHighlighter(QTextDocument *parent)
    : QSyntaxHighlighter(parent), m_theme(MIStyleManager::instance().currentTheme()),
      m_escapePattern(R"(\\(?:[nrtbfv0'"\\]|x[0-9A-Fa-f]{2}|u[0-9A-Fa-f]{4}))") {
  rebuildFormats();
  rebuildRules();
}

// ============================================================================
// Configuration
// ============================================================================

void MISyntaxHighlighter::setLanguage(LanguageId language) {
  if (m_language == language) {
    return;
  }
  m_language = language;
  rebuildRules();
  rehighlight();
}

void MISyntaxHighlighter::setLanguageFromFileName(const QString &fileName) {
  setLanguage(detectLanguage(QFileInfo(fileName).fileName().toStdString()));
}

void MISyntaxHighlighter::setTheme(Theme theme) {
  m_theme = theme;
  rebuildFormats();
  rehighlight();
}

QColor MISyntaxHighlighter::tokenColor(MIToken token, Theme theme) {
  QColor color;
  switch (token) {
  case MIToken::String:
    color = QColor(152, 195, 121);
    break;
  case MIToken::Number:
    color = QColor(209, 154, 102);
    break;
  case MIToken::Keyword:
    color = QColor(198, 120, 221);
    break;
  case MIToken::Type:
    color = QColor(224, 108, 117);
    break;
  case MIToken::Function:
    color = QColor(97, 175, 239);
    break;
  case MIToken::Comment:
    color = QColor(92, 99, 112);
    break;
  case MIToken::Operator:
    color = QColor(86, 182, 194);
    break;
  }
  return theme == Theme::Light ? darken(color) : color;
}

QTextCharFormat MISyntaxHighlighter::tokenFormat(MIToken token) const {
  return m_formats[static_cast<size_t>(tokenIndex(token))];
}

void MISyntaxHighlighter::rebuildFormats() {
  for (int i = 0; i <= tokenIndex(MIToken::Comment); ++i) {
    const auto token = static_cast<MIToken>(i);
    QTextCharFormat format;
    format.setForeground(tokenColor(token, m_theme));
    if (token == MIToken::Keyword) {
      format.setFontWeight(QFont::Bold);
    } else if (token == MIToken::Comment) {
      format.setFontItalic(true);
    }
    m_formats[static_cast<size_t>(i)] = format;
  }
}

void MISyntaxHighlighter::rebuildRules() {
  m_rules.clear();
  if (m_language == LanguageId::PlainText) {
    return;
  }

  const LanguageSpec &spec = languageSpec(m_language);

  if (!spec.keywords.empty()) {
    m_rules.push_back({wordListPattern(spec.keywords, spec.caseSensitiveKeywords),
                       MIToken::Keyword});
  }
  if (!spec.types.empty()) {
    m_rules.push_back({wordListPattern(spec.types, spec.caseSensitiveKeywords), MIToken::Type});
  }

  // Identifier followed by '(' unless it is a keyword such as "if ("
  QString callPattern = "\\b[A-Za-z_][A-Za-z0-9_]*(?=\\s*\\()";
  if (!spec.keywords.empty()) {
    callPattern = QString("\\b(?!(?:%1)\\b)[A-Za-z_][A-Za-z0-9_]*(?=\\s*\\()")
                      .arg(alternation(spec.keywords));
  }
  m_rules.push_back({QRegularExpression(callPattern), MIToken::Function});
  if (!spec.builtins.empty()) {
    m_rules.push_back({wordListPattern(spec.builtins, spec.caseSensitiveKeywords),
                       MIToken::Function});
  }

  if (spec.hasDecorators) {
    m_rules.push_back({QRegularExpression("@[A-Za-z_][A-Za-z0-9_.]*"), MIToken::Function});
  }

  if (spec.highlightsNumbers) {
    m_rules.push_back(
        {QRegularExpression(
             "\\b(?:0[xX][0-9A-Fa-f]+|0[bB][01]+|\\d+(?:\\.\\d+)?(?:[eE][+-]?\\d+)?)\\b"),
         MIToken::Number});
  }

  m_rules.push_back({QRegularExpression("[+\\-*/%=<>!&|^~?:;,{}\\[\\]()]"), MIToken::Operator});
}

// ============================================================================
// Highlighting
// ============================================================================

void MISyntaxHighlighter::highlightBlock(const QString &text) {
  setCurrentBlockState(0);
  if (m_language == LanguageId::PlainText) {
    return;
  }

  for (const auto &rule : m_rules) {
    QRegularExpressionMatchIterator it = rule.pattern.globalMatch(text);
    while (it.hasNext()) {
      const QRegularExpressionMatch match = it.next();
      setFormat(static_cast<int>(match.capturedStart()),
                static_cast<int>(match.capturedLength()), tokenFormat(rule.token));
    }
  }

  highlightStringsAndComments(text);
}

void MISyntaxHighlighter::highlightStringsAndComments(const QString &text) {
  const LanguageSpec &spec = languageSpec(m_language);
  const QString blockStart = QString::fromStdString(spec.blockCommentStart);
  const QString blockEnd = QString::fromStdString(spec.blockCommentEnd);
  const QString delimiters = QString::fromStdString(spec.stringDelimiters);
  QStringList lineComments;
  for (const auto &prefix : spec.lineComments) {
    lineComments.append(QString::fromStdString(prefix));
  }

  const QTextCharFormat commentFormat = tokenFormat(MIToken::Comment);
  const int length = static_cast<int>(text.size());
  int pos = 0;

  if (previousBlockState() == kInBlockComment && !blockEnd.isEmpty()) {
    const int end = static_cast<int>(text.indexOf(blockEnd));
    if (end < 0) {
      setFormat(0, length, commentFormat);
      setCurrentBlockState(kInBlockComment);
      return;
    }
    pos = end + static_cast<int>(blockEnd.size());
    setFormat(0, pos, commentFormat);
  }

  const QStringView view(text);
  while (pos < length) {
    const QStringView rest = view.mid(pos);

    if (!blockStart.isEmpty() && rest.startsWith(blockStart)) {
      const int end =
          static_cast<int>(text.indexOf(blockEnd, pos + static_cast<int>(blockStart.size())));
      if (end < 0) {
        setFormat(pos, length - pos, commentFormat);
        setCurrentBlockState(kInBlockComment);
        return;
      }
      const int stop = end + static_cast<int>(blockEnd.size());
      setFormat(pos, stop - pos, commentFormat);
      pos = stop;
      continue;
    }

    const bool lineComment = std::any_of(lineComments.cbegin(), lineComments.cend(),
                                         [&rest](const QString &p) { return rest.startsWith(p); });
    if (lineComment) {
      setFormat(pos, length - pos, commentFormat);
      return;
    }

    const QChar ch = text.at(pos);
    if (delimiters.contains(ch)) {
      int end = pos + 1;
      while (end < length && text.at(end) != ch) {
        end += (text.at(end) == '\\') ? 2 : 1;
      }
      end = std::min(end + 1, length);
      formatString(text, pos, end - pos);
      pos = end;
      continue;
    }

    ++pos;
  }
}

void MISyntaxHighlighter::formatString(const QString &text, int start, int length) {
  setFormat(start, length, tokenFormat(MIToken::String));

  const QTextCharFormat escapeFormat = tokenFormat(MIToken::Number);
  QRegularExpressionMatchIterator it =
      m_escapePattern.globalMatch(text.mid(start, length));
  while (it.hasNext()) {
    const QRegularExpressionMatch match = it.next();
    setFormat(start + static_cast<int>(match.capturedStart()),
              static_cast<int>(match.capturedLength()), escapeFormat);
  }
}

} // namespace McpIDE::editor::qt

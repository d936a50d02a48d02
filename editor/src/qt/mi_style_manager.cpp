#include "McpIDE/editor/qt/mi_style_manager.hpp"
#include "McpIDE/core/logger.hpp"

#include <QFontDatabase>
#include <QStyleFactory>

namespace McpIDE::editor::qt {

MIStyleManager &MIStyleManager::instance() {
  static MIStyleManager instance;
  return instance;
}

MIStyleManager::MIStyleManager() : QObject(nullptr) {
  m_palette = paletteFor(Theme::Dark);
  setupFonts();
}

void MIStyleManager::initialize(QApplication *app, Theme theme) {
  m_app = app;

  setupFonts();
  applyTheme(theme);
}

void MIStyleManager::setupFonts() {
#ifdef Q_OS_WIN
  m_defaultFont = QFont("Segoe UI", 9);
  m_monospaceFont = QFont("Consolas", 10);
#elif defined(Q_OS_MACOS)
  m_defaultFont = QFont(); // System default
  m_defaultFont.setPointSize(13);
  m_monospaceFont = QFont("Menlo", 12);
#else
  m_defaultFont = QFont(); // System default
  m_defaultFont.setPointSize(10);
  m_monospaceFont = QFont("Monospace", 10);

  // Prefer a well-known monospace family when the generic alias is missing
  if (QGuiApplication::instance() && !QFontDatabase::families().contains("Monospace")) {
    m_monospaceFont = QFontDatabase::systemFont(QFontDatabase::FixedFont);
  }
#endif

  m_monospaceFont.setStyleHint(QFont::Monospace);
  m_monospaceFont.setFixedPitch(true);
}

void MIStyleManager::applyTheme(Theme theme) {
  m_currentTheme = theme;
  m_palette = paletteFor(theme);

  if (!m_app) {
    emit themeChanged();
    return;
  }

  // Use Fusion style as base (cross-platform, customizable)
  m_app->setStyle(QStyleFactory::create("Fusion"));
  m_app->setPalette(createQPalette(theme));
  m_app->setFont(m_defaultFont);
  m_app->setStyleSheet(getStyleSheet());

  MCPIDE_LOG_INFO("Applied {} theme", themeName(theme).toStdString());
  emit themeChanged();
}

void MIStyleManager::applyTheme(const QString &themeName) {
  applyTheme(themeFromName(themeName));
}

QColor MIStyleManager::color(const QString &name) const {
  return color(name, m_currentTheme);
}

// ============================================================================
// Theme tables
// ============================================================================

EditorPalette MIStyleManager::paletteFor(Theme theme) {
  EditorPalette p;
  if (theme == Theme::Dark) {
    return p;
  }

  p.background = QColor(255, 255, 255);
  p.foreground = QColor(0, 0, 0);
  p.selection = QColor(173, 214, 255);
  p.accent = QColor(0, 122, 204);
  p.border = QColor(204, 204, 204);
  p.activeTab = QColor(255, 255, 255);
  p.inactiveTab = QColor(236, 236, 236);
  p.sidebar = QColor(243, 243, 243);
  p.lineNumber = QColor(110, 110, 110);
  p.currentLine = QColor(240, 240, 240);
  p.error = QColor(229, 20, 0);
  p.warning = QColor(191, 136, 3);
  p.info = QColor(26, 133, 255);
  p.success = QColor(56, 138, 52);

  p.surface = QColor(240, 240, 240);
  p.hover = QColor(225, 225, 225);
  p.textMuted = QColor(110, 110, 110);
  p.scrollbarThumb = QColor(193, 193, 193);
  return p;
}

QColor MIStyleManager::color(const QString &name, Theme theme) {
  const EditorPalette p = paletteFor(theme);

  if (name == "background")
    return p.background;
  if (name == "foreground")
    return p.foreground;
  if (name == "selection")
    return p.selection;
  if (name == "accent")
    return p.accent;
  if (name == "border")
    return p.border;
  if (name == "active_tab")
    return p.activeTab;
  if (name == "inactive_tab")
    return p.inactiveTab;
  if (name == "sidebar")
    return p.sidebar;
  if (name == "line_number")
    return p.lineNumber;
  if (name == "current_line")
    return p.currentLine;
  if (name == "error")
    return p.error;
  if (name == "warning")
    return p.warning;
  if (name == "info")
    return p.info;
  if (name == "success")
    return p.success;

  return theme == Theme::Light ? QColor(Qt::black) : QColor(Qt::white);
}

QPalette MIStyleManager::createQPalette(Theme theme) {
  QPalette palette;

  if (theme == Theme::Dark) {
    const QColor window(45, 45, 45);
    const QColor text(212, 212, 212);
    const QColor highlight(42, 130, 218);
    const QColor disabled(128, 128, 128);

    palette.setColor(QPalette::Window, window);
    palette.setColor(QPalette::WindowText, text);
    palette.setColor(QPalette::Base, QColor(30, 30, 30));
    palette.setColor(QPalette::AlternateBase, window);
    palette.setColor(QPalette::ToolTipBase, window);
    palette.setColor(QPalette::ToolTipText, text);
    palette.setColor(QPalette::Text, text);
    palette.setColor(QPalette::Button, window);
    palette.setColor(QPalette::ButtonText, text);
    palette.setColor(QPalette::BrightText, Qt::red);
    palette.setColor(QPalette::Link, highlight);
    palette.setColor(QPalette::Highlight, highlight);
    palette.setColor(QPalette::HighlightedText, Qt::white);
    palette.setColor(QPalette::PlaceholderText, disabled);
    palette.setColor(QPalette::Disabled, QPalette::Text, disabled);
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, disabled);
    palette.setColor(QPalette::Disabled, QPalette::WindowText, disabled);
    return palette;
  }

  const QColor window(240, 240, 240);
  const QColor highlight(0, 120, 215);
  const QColor disabled(160, 160, 160);

  palette.setColor(QPalette::Window, window);
  palette.setColor(QPalette::WindowText, Qt::black);
  palette.setColor(QPalette::Base, Qt::white);
  palette.setColor(QPalette::AlternateBase, QColor(245, 245, 245));
  palette.setColor(QPalette::ToolTipBase, QColor(255, 255, 220));
  palette.setColor(QPalette::ToolTipText, Qt::black);
  palette.setColor(QPalette::Text, Qt::black);
  palette.setColor(QPalette::Button, window);
  palette.setColor(QPalette::ButtonText, Qt::black);
  palette.setColor(QPalette::BrightText, Qt::red);
  palette.setColor(QPalette::Link, highlight);
  palette.setColor(QPalette::Highlight, highlight);
  palette.setColor(QPalette::HighlightedText, Qt::white);
  palette.setColor(QPalette::PlaceholderText, disabled);
  palette.setColor(QPalette::Disabled, QPalette::Text, disabled);
  palette.setColor(QPalette::Disabled, QPalette::ButtonText, disabled);
  palette.setColor(QPalette::Disabled, QPalette::WindowText, disabled);
  return palette;
}

Theme MIStyleManager::themeFromName(const QString &name) {
  return name.compare("light", Qt::CaseInsensitive) == 0 ? Theme::Light : Theme::Dark;
}

QString MIStyleManager::themeName(Theme theme) {
  return theme == Theme::Light ? QStringLiteral("light") : QStringLiteral("dark");
}

} // namespace McpIDE::editor::qt

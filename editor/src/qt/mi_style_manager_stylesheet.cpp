#include "McpIDE/editor/qt/mi_style_manager.hpp"

namespace McpIDE::editor::qt {

QString MIStyleManager::colorToStyleString(const QColor &color) {
  return QString("rgb(%1, %2, %3)").arg(color.red()).arg(color.green()).arg(color.blue());
}

QString MIStyleManager::getStyleSheet() const {
  const auto &p = m_palette;

  return QString(R"(
/* Application shell */

QMainWindow {
    background: %1;
}

QMainWindow::separator {
    background-color: %4;
    width: 1px;
    height: 1px;
}

QMainWindow::separator:hover {
    background-color: %5;
}

QToolTip {
    color: %2;
    background-color: %3;
    border: 1px solid %4;
    padding: 4px;
}

/* Docks */

QDockWidget {
    color: %2;
    titlebar-close-icon: none;
    titlebar-normal-icon: none;
}

QDockWidget::title {
    background: %6;
    color: %10;
    padding: 5px 8px;
    text-transform: uppercase;
    font-weight: 600;
}

/* Editor tabs */

QTabWidget::pane {
    border: none;
    border-top: 1px solid %4;
}

QTabBar::tab {
    background: %8;
    color: %10;
    padding: 5px 12px;
    border: none;
    border-right: 1px solid %4;
    border-top: 1px solid transparent;
}

QTabBar::tab:selected {
    background: %7;
    color: %2;
    border-top: 1px solid %5;
}

QTabBar::tab:hover:!selected {
    background: %9;
}

QTabBar::close-button {
    subcontrol-position: right;
}

/* Explorer */

QTreeView {
    background: %6;
    color: %2;
    border: none;
    show-decoration-selected: 1;
}

QTreeView::item {
    padding: 2px 0px;
}

QTreeView::item:hover {
    background: %9;
}

QTreeView::item:selected {
    background: %11;
    color: %2;
}

/* Inputs and buttons */

QLineEdit {
    background: %1;
    color: %2;
    border: 1px solid %4;
    border-radius: 2px;
    padding: 3px 6px;
}

QLineEdit:focus {
    border-color: %5;
}

QPushButton {
    background: %3;
    color: %2;
    border: 1px solid %4;
    border-radius: 2px;
    padding: 4px 14px;
}

QPushButton:hover {
    background: %9;
}

QPushButton:pressed, QPushButton:default {
    border-color: %5;
}

QPushButton:disabled {
    color: %10;
}

QCheckBox, QRadioButton, QLabel, QGroupBox {
    color: %2;
}

QGroupBox {
    border: 1px solid %4;
    border-radius: 3px;
    margin-top: 10px;
    padding-top: 6px;
}

QGroupBox::title {
    subcontrol-origin: margin;
    left: 8px;
    padding: 0px 4px;
}

QListWidget {
    background: %1;
    color: %2;
    border: 1px solid %4;
}

QListWidget::item:hover {
    background: %9;
}

QListWidget::item:selected {
    background: %11;
}

/* Menus, tool bar and status bar */

QMenuBar {
    background: %3;
    color: %2;
}

QMenuBar::item:selected {
    background: %9;
}

QMenu {
    background: %3;
    color: %2;
    border: 1px solid %4;
    padding: 4px 0px;
}

QMenu::item {
    padding: 4px 24px 4px 20px;
}

QMenu::item:selected {
    background: %11;
}

QMenu::item:disabled {
    color: %10;
}

QMenu::separator {
    height: 1px;
    background: %4;
    margin: 4px 8px;
}

QToolBar {
    background: %3;
    border: none;
    spacing: 2px;
    padding: 2px;
}

QToolButton {
    background: transparent;
    border: 1px solid transparent;
    border-radius: 3px;
    padding: 3px;
}

QToolButton:hover {
    background: %9;
}

QStatusBar {
    background: %5;
    color: white;
}

QStatusBar QLabel {
    color: white;
    padding: 0px 8px;
}

QSplitter::handle {
    background: %4;
}

/* Scroll bars */

QScrollBar:vertical {
    background: %1;
    width: 12px;
    margin: 0px;
}

QScrollBar:horizontal {
    background: %1;
    height: 12px;
    margin: 0px;
}

QScrollBar::handle:vertical, QScrollBar::handle:horizontal {
    background: %12;
    min-height: 24px;
    min-width: 24px;
}

QScrollBar::add-line, QScrollBar::sub-line {
    width: 0px;
    height: 0px;
}

QScrollBar::add-page, QScrollBar::sub-page {
    background: none;
}

/* Welcome page */

QWidget#MIWelcomePage {
    background: %1;
}

QLabel#MIWelcomeTitle {
    color: %2;
}

QLabel#MIWelcomeSubtitle, QLabel#MIWelcomeSectionTitle {
    color: %10;
}

QPushButton#MIWelcomeLinkButton {
    background: transparent;
    border: none;
    color: %5;
    text-align: left;
    padding: 2px 0px;
}

QPushButton#MIWelcomeLinkButton:hover {
    text-decoration: underline;
}
)")
      .arg(colorToStyleString(p.background))     // %1
      .arg(colorToStyleString(p.foreground))     // %2
      .arg(colorToStyleString(p.surface))        // %3
      .arg(colorToStyleString(p.border))         // %4
      .arg(colorToStyleString(p.accent))         // %5
      .arg(colorToStyleString(p.sidebar))        // %6
      .arg(colorToStyleString(p.activeTab))      // %7
      .arg(colorToStyleString(p.inactiveTab))    // %8
      .arg(colorToStyleString(p.hover))          // %9
      .arg(colorToStyleString(p.textMuted))      // %10
      .arg(colorToStyleString(p.selection))      // %11
      .arg(colorToStyleString(p.scrollbarThumb)); // %12
}

} // namespace McpIDE::editor::qt

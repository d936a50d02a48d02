#pragma once

/**
 * @file mi_style_manager.hpp
 * @brief Dark and light themes, named colors and the editor fonts
 *
 * A theme is installed as Fusion style plus a QPalette plus one application
 * stylesheet. Widgets that paint themselves (line number gutter, tab bars)
 * read colors by name and repaint on themeChanged().
 */

#include <QApplication>
#include <QColor>
#include <QFont>
#include <QObject>
#include <QPalette>
#include <QString>

namespace McpIDE::editor::qt {

/// Layout gaps in pixels
struct SpacingTokens {
  int sm = 8;
  int md = 12;
  int lg = 16;
  int xl = 24;
};

/// Point sizes for welcome page headings
struct TypographyTokens {
  int subtitleSize = 12;
  int titleSize = 14;
  int displaySize = 24;
};

enum class Theme { Dark, Light };

/**
 * @brief Named colors of a theme
 */
struct EditorPalette {
  QColor background{30, 30, 30};
  QColor foreground{212, 212, 212};
  QColor selection{38, 79, 120};
  QColor accent{0, 122, 204};
  QColor border{60, 60, 60};
  QColor activeTab{30, 30, 30};
  QColor inactiveTab{45, 45, 45};
  QColor sidebar{37, 37, 38};
  QColor lineNumber{120, 120, 120};
  QColor currentLine{40, 40, 40};
  QColor error{244, 71, 71};
  QColor warning{205, 151, 49};
  QColor info{55, 148, 255};
  QColor success{137, 209, 133};

  // Surfaces used only by the stylesheet
  QColor surface{45, 45, 45};
  QColor hover{62, 62, 64};
  QColor textMuted{150, 150, 150};
  QColor scrollbarThumb{79, 79, 79};
};

class MIStyleManager : public QObject {
  Q_OBJECT

public:
  static MIStyleManager &instance();

  /// Pick fonts and style @p app with @p theme; a null @p app only tracks the theme
  void initialize(QApplication *app, Theme theme = Theme::Dark);

  /**
   * @brief Apply a theme to the application
   *
   * The palette is switched even before initialize(); styling the
   * application requires a QApplication.
   */
  void applyTheme(Theme theme);

  void applyTheme(const QString &themeName);

  [[nodiscard]] Theme currentTheme() const { return m_currentTheme; }
  [[nodiscard]] const EditorPalette &palette() const { return m_palette; }

  [[nodiscard]] const SpacingTokens &spacing() const { return m_spacing; }
  [[nodiscard]] const TypographyTokens &typography() const { return m_typography; }

  [[nodiscard]] QFont defaultFont() const { return m_defaultFont; }

  /// Fixed pitch hint set; family and size come from the settings
  [[nodiscard]] QFont monospaceFont() const { return m_monospaceFont; }

  [[nodiscard]] QColor color(const QString &name) const;
  [[nodiscard]] QString getStyleSheet() const;

  // =========================================================================
  // Theme tables
  // =========================================================================

  [[nodiscard]] static EditorPalette paletteFor(Theme theme);

  /**
   * @brief Look up a named color ("line_number", "sidebar", ...)
   * @return White for unknown names in the dark theme, black in the light one
   */
  [[nodiscard]] static QColor color(const QString &name, Theme theme);

  /**
   * @brief Build the QPalette installed on the application
   */
  [[nodiscard]] static QPalette createQPalette(Theme theme);

  /**
   * @brief Map "light" to Light and anything else to Dark
   */
  [[nodiscard]] static Theme themeFromName(const QString &name);
  [[nodiscard]] static QString themeName(Theme theme);

  /// "rgb(r, g, b)" form for stylesheets
  static QString colorToStyleString(const QColor &color);

signals:
  void themeChanged();

private:
  MIStyleManager();
  ~MIStyleManager() override = default;

  MIStyleManager(const MIStyleManager &) = delete;
  MIStyleManager &operator=(const MIStyleManager &) = delete;

  void setupFonts();

  QApplication *m_app = nullptr;
  Theme m_currentTheme = Theme::Dark;
  EditorPalette m_palette;
  SpacingTokens m_spacing;
  TypographyTokens m_typography;
  QFont m_defaultFont;
  QFont m_monospaceFont;
};

} // namespace McpIDE::editor::qt

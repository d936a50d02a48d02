#pragma once

/**
 * @file mi_app_settings.hpp
 * @brief Application settings facade with Qt change signals
 *
 * Wraps MISettingsRegistry and a QSettings store. Every mutation is
 * validated by the registry, written through to the store immediately and
 * announced with a signal.
 */

#include "McpIDE/core/result.hpp"
#include "McpIDE/editor/settings_registry.hpp"
#include <QByteArray>
#include <QObject>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <memory>

namespace McpIDE::editor::qt {

class MIAppSettings : public QObject {
  Q_OBJECT

public:
  /**
   * @brief Create the settings facade
   * @param store Backing store; when null a native QSettings for the
   *        application identity is created and owned
   */
  explicit MIAppSettings(QSettings *store = nullptr, QObject *parent = nullptr);
  ~MIAppSettings() override;

  [[nodiscard]] MISettingsRegistry &registry() { return m_registry; }
  [[nodiscard]] const MISettingsRegistry &registry() const { return m_registry; }
  [[nodiscard]] QSettings &store() { return *m_store; }

  // =========================================================================
  // Theme
  // =========================================================================

  [[nodiscard]] QString theme() const;

  /**
   * @brief Switch theme; only "dark" and "light" are accepted
   * @return false for any other name
   */
  bool setTheme(const QString &theme);

  // =========================================================================
  // Workspaces
  // =========================================================================

  [[nodiscard]] QStringList recentWorkspaces() const;

  /**
   * @brief Put a workspace at the front of the recent list
   *
   * Removes an older entry for the same path, keeps at most ten entries,
   * records the path as last workspace and turns the welcome screen off.
   */
  void addRecentWorkspace(const QString &path);
  void removeRecentWorkspace(const QString &path);
  void clearRecentWorkspaces();

  [[nodiscard]] QString lastWorkspace() const;

  [[nodiscard]] bool shouldShowWelcomeScreen() const;
  void setShowWelcomeScreen(bool show);

  [[nodiscard]] bool isWelcomeTabClosed() const;
  void setWelcomeTabClosed(bool closed);

  // =========================================================================
  // Editor
  // =========================================================================

  [[nodiscard]] QString fontFamily() const;
  [[nodiscard]] int fontSize() const;
  bool setEditorFont(const QString &family, int size);

  [[nodiscard]] int tabSize() const;
  [[nodiscard]] bool useSpaces() const;
  [[nodiscard]] bool showLineNumbers() const;
  [[nodiscard]] bool wordWrap() const;
  [[nodiscard]] bool autoSave() const;
  [[nodiscard]] int autoSaveInterval() const;

  [[nodiscard]] QString editorLayout() const;
  bool setEditorLayout(const QString &layout);

  // =========================================================================
  // Generic access
  // =========================================================================

  /**
   * @brief Set a registered setting from a QVariant
   * @return false for unknown keys and rejected values
   */
  bool setSetting(const QString &key, const QVariant &value);

  /**
   * @brief Read a setting; unknown keys return @p fallback
   */
  [[nodiscard]] QVariant setting(const QString &key, const QVariant &fallback = {}) const;

  /**
   * @brief Persist all registry values and flush the store
   */
  Result<void> sync();

  // =========================================================================
  // Window layout (stored outside the registry)
  // =========================================================================

  [[nodiscard]] QByteArray windowGeometry() const;
  void setWindowGeometry(const QByteArray &geometry);
  [[nodiscard]] QByteArray windowState() const;
  void setWindowState(const QByteArray &state);
  [[nodiscard]] QStringList openFiles() const;
  void setOpenFiles(const QStringList &files);

signals:
  void themeChanged(const QString &theme);
  void recentWorkspacesChanged(const QStringList &workspaces);
  void editorFontChanged(const QString &family, int size);
  void settingChanged(const QString &key);

private:
  bool applyValue(const std::string &key, const SettingValue &value);
  void persistKey(const std::string &key);
  void setRecentList(const QStringList &list);

  MISettingsRegistry m_registry;
  std::unique_ptr<QSettings> m_ownedStore;
  QSettings *m_store = nullptr;
};

} // namespace McpIDE::editor::qt

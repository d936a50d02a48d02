#pragma once

/**
 * @file mi_welcome_page.hpp
 * @brief Welcome tab with start actions and recent workspaces
 */

#include <QString>
#include <QWidget>

class QCheckBox;
class QListWidget;
class QListWidgetItem;
class QPushButton;

namespace McpIDE::editor::qt {

class MIAppSettings;

class MIWelcomePage final : public QWidget {
  Q_OBJECT

public:
  explicit MIWelcomePage(MIAppSettings *settings, QWidget *parent = nullptr);
  ~MIWelcomePage() override = default;

  /**
   * @brief Number of real recent entries (the empty placeholder is not one)
   */
  [[nodiscard]] int recentCount() const;

  [[nodiscard]] QListWidget *recentList() const { return m_recentList; }

  /**
   * @brief Rebuild the recent list from settings
   */
  void reloadRecentWorkspaces();

signals:
  void newFileRequested();
  void openFileRequested();
  void openFolderRequested();
  void recentWorkspaceSelected(const QString &path);

private slots:
  void onRecentItemActivated(QListWidgetItem *item);

private:
  void setupUi();

  MIAppSettings *m_settings = nullptr;
  QPushButton *m_newFileButton = nullptr;
  QPushButton *m_openFileButton = nullptr;
  QPushButton *m_openFolderButton = nullptr;
  QListWidget *m_recentList = nullptr;
  QCheckBox *m_showOnStartup = nullptr;
};

} // namespace McpIDE::editor::qt

#include "McpIDE/editor/qt/mi_welcome_page.hpp"
#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_style_manager.hpp"

#include <QCheckBox>
#include <QDir>
#include <QFileInfo>
#include <QFrame>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QPushButton>
#include <QVBoxLayout>

namespace McpIDE::editor::qt {

MIWelcomePage::MIWelcomePage(MIAppSettings *settings, QWidget *parent)
    : QWidget(parent), m_settings(settings) {
  setObjectName("MIWelcomePage");
  setAttribute(Qt::WA_StyledBackground, true);
  setupUi();
  reloadRecentWorkspaces();

  if (m_settings) {
    connect(m_settings, &MIAppSettings::recentWorkspacesChanged, this,
            [this](const QStringList &) { reloadRecentWorkspaces(); });
  }
}

void MIWelcomePage::setupUi() {
  const auto &style = MIStyleManager::instance();
  const auto &spacing = style.spacing();
  const auto &typography = style.typography();

  auto *mainLayout = new QVBoxLayout(this);
  mainLayout->setContentsMargins(spacing.xl, spacing.xl, spacing.xl, spacing.xl);
  mainLayout->setSpacing(spacing.md);

  auto *title = new QLabel(tr("Welcome to McpIDE"), this);
  title->setObjectName("MIWelcomeTitle");
  QFont titleFont = title->font();
  titleFont.setPointSize(typography.displaySize);
  titleFont.setBold(true);
  title->setFont(titleFont);
  title->setAlignment(Qt::AlignCenter);
  mainLayout->addWidget(title);

  auto *subtitle = new QLabel(tr("A lightweight code editor"), this);
  subtitle->setObjectName("MIWelcomeSubtitle");
  QFont subtitleFont = subtitle->font();
  subtitleFont.setPointSize(typography.subtitleSize);
  subtitle->setFont(subtitleFont);
  subtitle->setAlignment(Qt::AlignCenter);
  mainLayout->addWidget(subtitle);

  auto *separator = new QFrame(this);
  separator->setFrameShape(QFrame::HLine);
  separator->setFrameShadow(QFrame::Sunken);
  mainLayout->addWidget(separator);

  QFont sectionFont = font();
  sectionFont.setPointSize(typography.titleSize);
  sectionFont.setBold(true);

  // Start column
  auto *startLayout = new QVBoxLayout();
  startLayout->setSpacing(spacing.sm);
  auto *startLabel = new QLabel(tr("Start"), this);
  startLabel->setObjectName("MIWelcomeSectionTitle");
  startLabel->setFont(sectionFont);
  startLayout->addWidget(startLabel);

  m_newFileButton = new QPushButton(tr("New File"), this);
  m_openFileButton = new QPushButton(tr("Open File..."), this);
  m_openFolderButton = new QPushButton(tr("Open Folder..."), this);
  for (QPushButton *button : {m_newFileButton, m_openFileButton, m_openFolderButton}) {
    button->setObjectName("MIWelcomeLinkButton");
    button->setCursor(Qt::PointingHandCursor);
    startLayout->addWidget(button);
  }
  startLayout->addStretch();

  // Recent column
  auto *recentLayout = new QVBoxLayout();
  recentLayout->setSpacing(spacing.sm);
  auto *recentLabel = new QLabel(tr("Recent"), this);
  recentLabel->setObjectName("MIWelcomeSectionTitle");
  recentLabel->setFont(sectionFont);
  recentLayout->addWidget(recentLabel);

  m_recentList = new QListWidget(this);
  m_recentList->setAlternatingRowColors(true);
  recentLayout->addWidget(m_recentList, 1);

  auto *contentLayout = new QHBoxLayout();
  contentLayout->setSpacing(spacing.xl);
  contentLayout->addLayout(startLayout, 1);
  contentLayout->addLayout(recentLayout, 2);
  mainLayout->addLayout(contentLayout, 1);

  m_showOnStartup = new QCheckBox(tr("Show welcome page on startup"), this);
  m_showOnStartup->setChecked(m_settings ? m_settings->shouldShowWelcomeScreen() : true);
  mainLayout->addWidget(m_showOnStartup);

  connect(m_newFileButton, &QPushButton::clicked, this, &MIWelcomePage::newFileRequested);
  connect(m_openFileButton, &QPushButton::clicked, this, &MIWelcomePage::openFileRequested);
  connect(m_openFolderButton, &QPushButton::clicked, this,
          &MIWelcomePage::openFolderRequested);
  connect(m_recentList, &QListWidget::itemActivated, this,
          &MIWelcomePage::onRecentItemActivated);
  connect(m_showOnStartup, &QCheckBox::toggled, this, [this](bool checked) {
    if (m_settings) {
      m_settings->setShowWelcomeScreen(checked);
    }
  });
}

void MIWelcomePage::reloadRecentWorkspaces() {
  m_recentList->clear();

  const QStringList workspaces = m_settings ? m_settings->recentWorkspaces() : QStringList();
  if (workspaces.isEmpty()) {
    auto *placeholder = new QListWidgetItem(tr("No recent workspaces"), m_recentList);
    placeholder->setFlags(Qt::NoItemFlags);
    return;
  }

  for (const QString &path : workspaces) {
    QString name = QFileInfo(path).fileName();
    if (name.isEmpty()) {
      name = QDir::toNativeSeparators(path);
    }
    auto *item = new QListWidgetItem(name, m_recentList);
    item->setToolTip(path);
    item->setData(Qt::UserRole, path);
  }
}

int MIWelcomePage::recentCount() const {
  int count = 0;
  for (int i = 0; i < m_recentList->count(); ++i) {
    if (!m_recentList->item(i)->data(Qt::UserRole).toString().isEmpty()) {
      ++count;
    }
  }
  return count;
}

void MIWelcomePage::onRecentItemActivated(QListWidgetItem *item) {
  if (!item) {
    return;
  }
  const QString path = item->data(Qt::UserRole).toString();
  if (!path.isEmpty()) {
    emit recentWorkspaceSelected(path);
  }
}

} // namespace McpIDE::editor::qt

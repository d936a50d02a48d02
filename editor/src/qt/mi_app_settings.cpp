#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/settings_persistence.hpp"

namespace McpIDE::editor::qt {

namespace {

constexpr const char *kKeyTheme = "theme";
constexpr const char *kKeyRecent = "recent_workspaces";
constexpr const char *kKeyLastWorkspace = "last_workspace";
constexpr const char *kKeyShowWelcome = "show_welcome_screen";
constexpr const char *kKeyWelcomeClosed = "welcome_tab_closed";
constexpr const char *kKeyFontFamily = "font_family";
constexpr const char *kKeyFontSize = "font_size";
constexpr const char *kKeyEditorLayout = "editor_layout";

constexpr const char *kKeyGeometry = "mainwindow/geometry";
constexpr const char *kKeyWindowState = "mainwindow/state";
constexpr const char *kKeyOpenFiles = "editor/open_files";

QStringList toQStringList(const std::vector<std::string> &items) {
  QStringList list;
  list.reserve(static_cast<qsizetype>(items.size()));
  for (const auto &item : items) {
    list.append(QString::fromStdString(item));
  }
  return list;
}

std::vector<std::string> toStdList(const QStringList &list) {
  std::vector<std::string> items;
  items.reserve(static_cast<size_t>(list.size()));
  for (const auto &item : list) {
    items.push_back(item.toStdString());
  }
  return items;
}

} // namespace

MIAppSettings::MIAppSettings(QSettings *store, QObject *parent) : QObject(parent) {
  if (store) {
    m_store = store;
  } else {
    m_ownedStore = std::make_unique<QSettings>();
    m_store = m_ownedStore.get();
  }

  m_registry.registerEditorDefaults();
  SettingsPersistence::writeMissingDefaults(*m_store, m_registry);

  auto loadResult = SettingsPersistence::load(*m_store, m_registry);
  if (loadResult.isError()) {
    MCPIDE_LOG_WARN("Failed to load settings, using defaults: {}", loadResult.error());
  }
}

MIAppSettings::~MIAppSettings() = default;

// ============================================================================
// Theme
// ============================================================================

QString MIAppSettings::theme() const {
  return QString::fromStdString(m_registry.getString(kKeyTheme, "dark"));
}

bool MIAppSettings::setTheme(const QString &theme) {
  if (!applyValue(kKeyTheme, theme.toStdString())) {
    return false;
  }
  emit themeChanged(theme);
  emit settingChanged(kKeyTheme);
  return true;
}

// ============================================================================
// Workspaces
// ============================================================================

QStringList MIAppSettings::recentWorkspaces() const {
  return toQStringList(m_registry.getStringList(kKeyRecent));
}

void MIAppSettings::addRecentWorkspace(const QString &path) {
  if (path.isEmpty()) {
    return;
  }

  QStringList recent = recentWorkspaces();
  recent.removeAll(path);
  recent.prepend(path);
  while (recent.size() > static_cast<qsizetype>(MISettingsRegistry::MAX_RECENT_WORKSPACES)) {
    recent.removeLast();
  }

  setRecentList(recent);
  applyValue(kKeyLastWorkspace, path.toStdString());
  applyValue(kKeyShowWelcome, false);

  emit recentWorkspacesChanged(recent);
  emit settingChanged(kKeyRecent);
}

void MIAppSettings::removeRecentWorkspace(const QString &path) {
  QStringList recent = recentWorkspaces();
  if (recent.removeAll(path) == 0) {
    return;
  }
  setRecentList(recent);
  if (lastWorkspace() == path) {
    applyValue(kKeyLastWorkspace, std::string());
  }
  emit recentWorkspacesChanged(recent);
  emit settingChanged(kKeyRecent);
}

void MIAppSettings::clearRecentWorkspaces() {
  setRecentList({});
  emit recentWorkspacesChanged({});
  emit settingChanged(kKeyRecent);
}

QString MIAppSettings::lastWorkspace() const {
  return QString::fromStdString(m_registry.getString(kKeyLastWorkspace));
}

bool MIAppSettings::shouldShowWelcomeScreen() const {
  return m_registry.getBool(kKeyShowWelcome, true);
}

void MIAppSettings::setShowWelcomeScreen(bool show) {
  if (applyValue(kKeyShowWelcome, show)) {
    emit settingChanged(kKeyShowWelcome);
  }
}

bool MIAppSettings::isWelcomeTabClosed() const { return m_registry.getBool(kKeyWelcomeClosed); }

void MIAppSettings::setWelcomeTabClosed(bool closed) {
  if (applyValue(kKeyWelcomeClosed, closed)) {
    emit settingChanged(kKeyWelcomeClosed);
  }
}

// ============================================================================
// Editor
// ============================================================================

QString MIAppSettings::fontFamily() const {
  return QString::fromStdString(m_registry.getString(kKeyFontFamily, "Consolas"));
}

int MIAppSettings::fontSize() const { return m_registry.getInt(kKeyFontSize, 12); }

bool MIAppSettings::setEditorFont(const QString &family, int size) {
  // Validate both before touching either so a bad size leaves the family alone
  auto familyDef = m_registry.getDefinition(kKeyFontFamily);
  auto sizeDef = m_registry.getDefinition(kKeyFontSize);
  if (family.trimmed().isEmpty() || !sizeDef || size < sizeDef->minValue ||
      size > sizeDef->maxValue || !familyDef) {
    MCPIDE_LOG_WARN("Rejected editor font '{}' {}pt", family.toStdString(), size);
    return false;
  }

  applyValue(kKeyFontFamily, family.toStdString());
  applyValue(kKeyFontSize, static_cast<i32>(size));
  emit editorFontChanged(family, size);
  emit settingChanged(kKeyFontFamily);
  emit settingChanged(kKeyFontSize);
  return true;
}

int MIAppSettings::tabSize() const { return m_registry.getInt("tab_size", 4); }

bool MIAppSettings::useSpaces() const { return m_registry.getBool("use_spaces", true); }

bool MIAppSettings::showLineNumbers() const {
  return m_registry.getBool("show_line_numbers", true);
}

bool MIAppSettings::wordWrap() const { return m_registry.getBool("word_wrap", false); }

bool MIAppSettings::autoSave() const { return m_registry.getBool("auto_save", false); }

int MIAppSettings::autoSaveInterval() const {
  return m_registry.getInt("auto_save_interval", 30000);
}

QString MIAppSettings::editorLayout() const {
  return QString::fromStdString(m_registry.getString(kKeyEditorLayout, "single"));
}

bool MIAppSettings::setEditorLayout(const QString &layout) {
  if (!applyValue(kKeyEditorLayout, layout.toStdString())) {
    return false;
  }
  emit settingChanged(kKeyEditorLayout);
  return true;
}

// ============================================================================
// Generic access
// ============================================================================

bool MIAppSettings::setSetting(const QString &key, const QVariant &value) {
  const std::string stdKey = key.toStdString();
  auto def = m_registry.getDefinition(stdKey);
  if (!def) {
    MCPIDE_LOG_WARN("Unknown setting '{}'", stdKey);
    return false;
  }

  auto converted = SettingsPersistence::fromVariant(value, def->type);
  if (converted.isError()) {
    MCPIDE_LOG_WARN("Rejected value for setting '{}': {}", stdKey, converted.error());
    return false;
  }
  if (!applyValue(stdKey, converted.value())) {
    return false;
  }

  if (key == kKeyTheme) {
    emit themeChanged(theme());
  } else if (key == kKeyRecent) {
    emit recentWorkspacesChanged(recentWorkspaces());
  } else if (key == kKeyFontFamily || key == kKeyFontSize) {
    emit editorFontChanged(fontFamily(), fontSize());
  }
  emit settingChanged(key);
  return true;
}

QVariant MIAppSettings::setting(const QString &key, const QVariant &fallback) const {
  auto value = m_registry.getValue(key.toStdString());
  if (!value) {
    return fallback;
  }
  return SettingsPersistence::toVariant(*value);
}

Result<void> MIAppSettings::sync() {
  auto result = SettingsPersistence::save(*m_store, m_registry);
  if (result.isError()) {
    MCPIDE_LOG_ERROR("{}", result.error());
  }
  return result;
}

// ============================================================================
// Window layout
// ============================================================================

QByteArray MIAppSettings::windowGeometry() const {
  return m_store->value(kKeyGeometry).toByteArray();
}

void MIAppSettings::setWindowGeometry(const QByteArray &geometry) {
  m_store->setValue(kKeyGeometry, geometry);
}

QByteArray MIAppSettings::windowState() const {
  return m_store->value(kKeyWindowState).toByteArray();
}

void MIAppSettings::setWindowState(const QByteArray &state) {
  m_store->setValue(kKeyWindowState, state);
}

QStringList MIAppSettings::openFiles() const {
  // A single entry comes back from INI stores as a plain string
  const QVariant value = m_store->value(kKeyOpenFiles);
  if (value.typeId() == QMetaType::QString) {
    const QString single = value.toString();
    return single.isEmpty() ? QStringList() : QStringList{single};
  }
  return value.toStringList();
}

void MIAppSettings::setOpenFiles(const QStringList &files) {
  m_store->setValue(kKeyOpenFiles, files);
}

// ============================================================================
// Private
// ============================================================================

bool MIAppSettings::applyValue(const std::string &key, const SettingValue &value) {
  const std::string error = m_registry.setValue(key, value);
  if (!error.empty()) {
    return false;
  }
  persistKey(key);
  return true;
}

void MIAppSettings::persistKey(const std::string &key) {
  auto value = m_registry.getValue(key);
  if (!value) {
    return;
  }
  m_store->setValue(QString::fromStdString(key), SettingsPersistence::toVariant(*value));
}

void MIAppSettings::setRecentList(const QStringList &list) {
  applyValue(kKeyRecent, toStdList(list));
}

} // namespace McpIDE::editor::qt

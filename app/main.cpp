/**
 * @file main.cpp
 * @brief McpIDE - Main Entry Point
 *
 * Usage:
 *   mcpide                     # Start with the last session
 *   mcpide <folder>            # Open a folder as the workspace
 *   mcpide <file>              # Open a file in an editor
 *   mcpide --debug             # Enable debug logging
 *   mcpide --log-file <path>   # Also write the log to a file
 */

#include "McpIDE/core/logger.hpp"
#include "McpIDE/editor/qt/mi_app_settings.hpp"
#include "McpIDE/editor/qt/mi_main_window.hpp"
#include "McpIDE/editor/qt/mi_style_manager.hpp"

#include <QApplication>
#include <QCommandLineParser>
#include <QFileInfo>

namespace {

using McpIDE::core::Logger;
using McpIDE::core::LogLevel;

struct LaunchOptions {
  bool debug = false;
  QString logFile;
  QString path;
};

LaunchOptions parseArgs(const QApplication &app) {
  QCommandLineParser parser;
  parser.setApplicationDescription(QApplication::translate("main", "A lightweight code editor"));
  parser.addHelpOption();
  parser.addVersionOption();

  const QCommandLineOption debugOption(
      "debug", QApplication::translate("main", "Enable debug logging"));
  const QCommandLineOption logFileOption(
      "log-file", QApplication::translate("main", "Write the log to <file>"), "file");
  parser.addOption(debugOption);
  parser.addOption(logFileOption);
  parser.addPositionalArgument("path",
                               QApplication::translate("main", "File or folder to open"),
                               "[path]");
  parser.process(app);

  LaunchOptions options;
  options.debug = parser.isSet(debugOption);
  options.logFile = parser.value(logFileOption);
  const QStringList positional = parser.positionalArguments();
  if (!positional.isEmpty()) {
    options.path = positional.first();
  }
  return options;
}

void configureLogging(const LaunchOptions &options) {
  McpIDE::core::LoggerConfig config;
  config.level = options.debug ? LogLevel::Debug : LogLevel::Info;
  config.filePath = options.logFile.toStdString();
  if (!Logger::instance().configure(config)) {
    MCPIDE_LOG_WARN("Could not open log file {}", config.filePath);
  }
}

} // namespace

int main(int argc, char *argv[]) {
  QApplication app(argc, argv);
  QApplication::setApplicationName("McpIDE");
  QApplication::setOrganizationName("McpIDE");
  QApplication::setOrganizationDomain("mcpide.org");
  QApplication::setApplicationVersion("0.1.0");

  const LaunchOptions options = parseArgs(app);
  configureLogging(options);
  MCPIDE_LOG_INFO("Starting McpIDE {}", QApplication::applicationVersion().toStdString());

  McpIDE::editor::qt::MIAppSettings settings;

  auto &styleManager = McpIDE::editor::qt::MIStyleManager::instance();
  styleManager.initialize(&app,
                          McpIDE::editor::qt::MIStyleManager::themeFromName(settings.theme()));

  McpIDE::editor::qt::MIMainWindow window(settings);
  if (!window.initialize()) {
    MCPIDE_LOG_FATAL("Failed to initialize the main window");
    return 1;
  }
  window.show();

  if (!options.path.isEmpty()) {
    const QFileInfo info(options.path);
    if (info.isDir()) {
      window.openWorkspace(info.absoluteFilePath());
    } else {
      window.openFilePath(info.absoluteFilePath());
    }
  }

  const int exitCode = app.exec();
  MCPIDE_LOG_INFO("McpIDE exited with code {}", exitCode);
  return exitCode;
}

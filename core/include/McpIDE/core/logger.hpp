#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide logger used by every McpIDE module
 *
 * Lines go to stdout (stderr from Warning up), to an optional log file and
 * to any registered sinks. Call sites use the MCPIDE_LOG_* macros, which
 * accept either a plain message or a std::format string with arguments.
 */

#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace McpIDE::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Startup configuration, usually derived from the command line
 */
struct LoggerConfig {
  LogLevel level = LogLevel::Info;
  bool useColors = true;
  std::string filePath; ///< Appended to when not empty
};

class Logger {
public:
  using Sink = std::function<void(LogLevel, const std::string &)>;
  using SinkId = int;

  static Logger &instance();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  /**
   * @brief Apply a whole configuration at once
   * @return false when the log file could not be opened; console output
   *         still works in that case
   */
  bool configure(const LoggerConfig &config);

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel level() const;
  [[nodiscard]] bool isEnabled(LogLevel level) const;

  bool openFile(const std::string &path);
  void closeFile();

  /// Sinks receive the formatted message without timestamp or level prefix
  SinkId addSink(Sink sink);
  void removeSink(SinkId id);

  void log(LogLevel level, std::string_view message);

  template <typename... Args>
  void log(LogLevel level, std::format_string<Args...> fmt, Args &&...args) {
    if (isEnabled(level)) {
      log(level, std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }
  }

  [[nodiscard]] static const char *levelName(LogLevel level);

private:
  Logger() = default;
  ~Logger();

  void writeLine(LogLevel level, std::string_view message);

  LogLevel m_level = LogLevel::Info;
  bool m_useColors = true;
  std::ofstream m_file;
  std::vector<std::pair<SinkId, Sink>> m_sinks;
  SinkId m_nextSinkId = 1;
  mutable std::mutex m_mutex;
};

} // namespace McpIDE::core

#define MCPIDE_LOG_TRACE(...)                                                                     \
  ::McpIDE::core::Logger::instance().log(::McpIDE::core::LogLevel::Trace, __VA_ARGS__)
#define MCPIDE_LOG_DEBUG(...)                                                                     \
  ::McpIDE::core::Logger::instance().log(::McpIDE::core::LogLevel::Debug, __VA_ARGS__)
#define MCPIDE_LOG_INFO(...)                                                                      \
  ::McpIDE::core::Logger::instance().log(::McpIDE::core::LogLevel::Info, __VA_ARGS__)
#define MCPIDE_LOG_WARN(...)                                                                      \
  ::McpIDE::core::Logger::instance().log(::McpIDE::core::LogLevel::Warning, __VA_ARGS__)
#define MCPIDE_LOG_ERROR(...)                                                                     \
  ::McpIDE::core::Logger::instance().log(::McpIDE::core::LogLevel::Error, __VA_ARGS__)
#define MCPIDE_LOG_FATAL(...)                                                                     \
  ::McpIDE::core::Logger::instance().log(::McpIDE::core::LogLevel::Fatal, __VA_ARGS__)

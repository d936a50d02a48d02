#include "McpIDE/core/logger.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace McpIDE::core {

namespace {

const char *levelColor(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000;

  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif
  return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec,
                     millis);
}

} // namespace

Logger &Logger::instance() {
  static Logger s_instance;
  return s_instance;
}

Logger::~Logger() { closeFile(); }

bool Logger::configure(const LoggerConfig &config) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level = config.level;
    m_useColors = config.useColors;
  }
  if (config.filePath.empty()) {
    closeFile();
    return true;
  }
  return openFile(config.filePath);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

bool Logger::isEnabled(LogLevel level) const {
  return level != LogLevel::Off && level >= this->level();
}

bool Logger::openFile(const std::string &path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_file.is_open()) {
    m_file.close();
  }
  m_file.open(path, std::ios::out | std::ios::app);
  return m_file.is_open();
}

void Logger::closeFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_file.is_open()) {
    m_file.close();
  }
}

Logger::SinkId Logger::addSink(Sink sink) {
  std::lock_guard<std::mutex> lock(m_mutex);
  const SinkId id = m_nextSinkId++;
  m_sinks.emplace_back(id, std::move(sink));
  return id;
}

void Logger::removeSink(SinkId id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::erase_if(m_sinks, [id](const auto &entry) { return entry.first == id; });
}

void Logger::log(LogLevel level, std::string_view message) {
  if (!isEnabled(level)) {
    return;
  }

  std::vector<Sink> sinks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    writeLine(level, message);
    sinks.reserve(m_sinks.size());
    for (const auto &[id, sink] : m_sinks) {
      sinks.push_back(sink);
    }
  }

  // Sinks run unlocked so they may log or remove themselves
  const std::string text(message);
  for (const auto &sink : sinks) {
    if (sink) {
      sink(level, text);
    }
  }
}

void Logger::writeLine(LogLevel level, std::string_view message) {
  const std::string prefix = std::format("[{}] [{}] ", timestamp(), levelName(level));
  std::ostream &console = level >= LogLevel::Warning ? std::cerr : std::cout;
  if (m_useColors) {
    console << levelColor(level) << prefix << "\033[0m" << message << '\n';
  } else {
    console << prefix << message << '\n';
  }

  if (m_file.is_open()) {
    m_file << prefix << message << '\n';
    m_file.flush();
  }
}

const char *Logger::levelName(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

} // namespace McpIDE::core

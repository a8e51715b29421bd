#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <vector>
#include <thread>
#include <condition_variable>
#include <atomic>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Accepts debug|info|warn|warning|error|critical (any case); falls back to the given level.
LogLevel ParseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

// Process-wide async logger. A background thread drains queued lines in batches to the
// log file and, when enabled, to stderr. Calls made before Initialize() are dropped.
class Logger {
public:
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool console_echo = false);
  // Flushes whatever is queued and stops the writer thread.
  static void Shutdown();
  static void Log(LogLevel level, const std::string& message, const std::string& file = __FILE__, int line = __LINE__);
  static void Debug(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Info(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Warning(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Error(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Critical(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  ~Logger();

private:
  struct Entry {
    std::chrono::system_clock::time_point at;
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread;
  };

  Logger() = default;
  void Run();
  void Stop();
  static std::string Format(const Entry& e);

  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;

  std::mutex queue_mutex_;
  std::condition_variable cv_;
  std::vector<Entry> pending_;
  std::thread writer_;
  std::ofstream file_;
  bool running_ = false;
  std::atomic<bool> console_echo_{false};
  LogLevel min_level_ = LogLevel::INFO;
};

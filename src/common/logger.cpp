#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

namespace {
// UTC with millisecond precision, matching the timestamps in the event log and reports.
std::string UtcStamp(const std::chrono::system_clock::time_point& tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf{};
  gmtime_r(&t, &tm_buf);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

const char* LevelTag(LogLevel l) {
  switch (l) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO ";
    case LogLevel::WARNING: return "WARN ";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT ";
  }
  return "?    ";
}

// Keeps "dir/file.cpp" so lines from scanner/ and protocols/ stay distinguishable.
std::string SourceTag(const std::string& path) {
  auto last = path.find_last_of("/\\");
  if (last == std::string::npos || last == 0) return path;
  auto prev = path.find_last_of("/\\", last - 1);
  return prev == std::string::npos ? path : path.substr(prev + 1);
}
}

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info") return LogLevel::INFO;
  if (s == "warn" || s == "warning") return LogLevel::WARNING;
  if (s == "error") return LogLevel::ERROR;
  if (s == "critical" || s == "crit") return LogLevel::CRITICAL;
  return fallback;
}

void Logger::Initialize(const std::string& path, LogLevel min_level, bool console_echo) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) {
    // Already running: only the filters change.
    instance_->min_level_ = min_level;
    instance_->console_echo_ = console_echo;
    return;
  }
  std::unique_ptr<Logger> logger(new Logger());
  logger->min_level_ = min_level;
  logger->console_echo_ = console_echo;
  if (!path.empty()) {
    logger->file_.open(path, std::ios::out | std::ios::app);
    if (!logger->file_.is_open()) std::cerr << "cannot open log file " << path << ", logging to stderr only\n";
  }
  logger->running_ = true;
  logger->writer_ = std::thread(&Logger::Run, logger.get());
  instance_ = std::move(logger);
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> logger;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    logger = std::move(instance_);
  }
  if (logger) logger->Stop();
}

Logger::~Logger() { Stop(); }

void Logger::Stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (writer_.joinable()) writer_.join();
  if (file_.is_open()) file_.close();
}

void Logger::Run() {
  std::vector<Entry> batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      cv_.wait(lock, [&]{ return !pending_.empty() || !running_; });
      if (pending_.empty() && !running_) return;
      batch.swap(pending_);
    }
    std::string text;
    for (const auto& e : batch) text += Format(e);
    batch.clear();
    if (file_.is_open()) {
      file_ << text;
      file_.flush();
    }
    if (console_echo_ || !file_.is_open()) std::cerr << text;
  }
}

std::string Logger::Format(const Entry& e) {
  std::ostringstream oss;
  oss << UtcStamp(e.at) << ' ' << LevelTag(e.level) << " [" << e.thread << "] "
      << SourceTag(e.file) << ':' << e.line << "  " << e.message << '\n';
  return oss.str();
}

void Logger::Log(LogLevel level, const std::string& message, const std::string& file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_ || level < instance_->min_level_) return;
  {
    std::lock_guard<std::mutex> qlock(instance_->queue_mutex_);
    instance_->pending_.push_back(Entry{std::chrono::system_clock::now(), level, message, file, line,
                                        std::this_thread::get_id()});
  }
  instance_->cv_.notify_one();
}

void Logger::Debug(const std::string& m, const std::string& f, int l) { Log(LogLevel::DEBUG, m, f, l); }
void Logger::Info(const std::string& m, const std::string& f, int l) { Log(LogLevel::INFO, m, f, l); }
void Logger::Warning(const std::string& m, const std::string& f, int l) { Log(LogLevel::WARNING, m, f, l); }
void Logger::Error(const std::string& m, const std::string& f, int l) { Log(LogLevel::ERROR, m, f, l); }
void Logger::Critical(const std::string& m, const std::string& f, int l) { Log(LogLevel::CRITICAL, m, f, l); }

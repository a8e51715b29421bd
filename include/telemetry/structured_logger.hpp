#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// Scan lifecycle events (scan_started, adapter_failed, pool_failed, scan_completed,
// scan_cancelled) as JSON lines. Events sent before Initialize() or after Shutdown() are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // No-op for an empty path or when already running.
  void Initialize(const std::string& file_path);
  // Adds "event" and "ts" (unix ms) to `fields` and queues one line.
  void LogEvent(const std::string& event, nlohmann::json fields = nlohmann::json::object());
  // Writes out the queue and stops the worker; Initialize() may be called again afterwards.
  void Shutdown();
  bool IsRunning();

private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Enqueue(std::string line);
  void Worker();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> lines_;
  std::thread worker_;
  bool running_ = false;
  std::string path_;
};

#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <fstream>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_ || file_path.empty()) return;
  path_ = file_path;
  running_ = true;
  worker_ = std::thread(&StructuredLogger::Worker, this);
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool StructuredLogger::IsRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void StructuredLogger::LogEvent(const std::string& event, nlohmann::json fields) {
  if (!fields.is_object()) fields = nlohmann::json{{"value", fields}};
  fields["event"] = event;
  fields["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  Enqueue(fields.dump());
}

void StructuredLogger::Enqueue(std::string line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    lines_.push(std::move(line));
  }
  cv_.notify_one();
}

void StructuredLogger::Worker() {
  std::ofstream out(path_, std::ios::app | std::ios::out);
  if (!out.is_open()) Logger::Error("cannot open event log " + path_ + ", events are discarded", __FILE__, __LINE__);
  std::string batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&]{ return !lines_.empty() || !running_; });
      if (lines_.empty() && !running_) break;
      while (!lines_.empty() && batch.size() < 8192) {
        batch += lines_.front();
        batch += '\n';
        lines_.pop();
      }
    }
    if (out.is_open()) {
      out << batch;
      out.flush();
    }
    batch.clear();
  }
}

#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

// Token price cache with a fixed time-to-live. Entries are replaced whole on refresh;
// concurrent writers of the same key are allowed and the last write wins.
class PriceCache {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Clock = std::function<TimePoint()>;

  explicit PriceCache(std::chrono::seconds ttl = std::chrono::seconds(300), Clock clock = Clock());

  std::optional<double> Get(const std::string& key) const;
  void Put(const std::string& key, double price);
  void Invalidate(const std::string& key);
  void Clear();
  // Drops expired entries; returns how many were removed.
  size_t Purge();
  size_t Size() const;
  std::chrono::seconds Ttl() const { return ttl_; }

private:
  struct Entry {
    double price;
    TimePoint expires_at;
  };
  TimePoint Now() const { return clock_ ? clock_() : std::chrono::steady_clock::now(); }

  std::chrono::seconds ttl_;
  Clock clock_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

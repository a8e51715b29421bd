#include "cache/price_cache.hpp"
#include <mutex>

PriceCache::PriceCache(std::chrono::seconds ttl, Clock clock)
  : ttl_(ttl), clock_(std::move(clock)) {}

std::optional<double> PriceCache::Get(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  if (Now() >= it->second.expires_at) return std::nullopt;
  return it->second.price;
}

void PriceCache::Put(const std::string& key, double price) {
  Entry fresh{price, Now() + ttl_};
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_[key] = fresh;
}

void PriceCache::Invalidate(const std::string& key) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.erase(key);
}

void PriceCache::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

size_t PriceCache::Purge() {
  const auto now = Now();
  std::unique_lock<std::shared_mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now >= it->second.expires_at) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t PriceCache::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

#include "cache/token_cache.hpp"
#include "node_connection/contract_reader.hpp"
#include "encoding/abi.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <mutex>
#include <stdexcept>

Token TokenCache::Get(const std::string& address) {
  const std::string key = NormalizeAddress(address);
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
  }
  // Fetched outside the lock; two racing fetches of one token write the same value.
  Token t;
  t.address = key;
  const auto dec = reader_.Call(key, "decimals()");
  if (Abi::WordCount(dec) < 1) throw std::runtime_error("decimals() returned no data for " + key);
  t.decimals = static_cast<int>(Abi::DecodeUint64(dec));
  if (t.decimals > 77) throw std::runtime_error("implausible decimals " + std::to_string(t.decimals) + " for " + key);
  try {
    t.symbol = Abi::DecodeString(reader_.Call(key, "symbol()"));
  } catch (const std::exception& e) {
    Logger::Debug("symbol() unavailable for " + key + ": " + e.what(), __FILE__, __LINE__);
    t.symbol = "?";
  }
  Put(t);
  return t;
}

void TokenCache::Put(const Token& token) {
  Token stored = token;
  stored.address = NormalizeAddress(token.address);
  stored.price_usd.reset();
  std::unique_lock<std::shared_mutex> lock(mutex_);
  cache_[stored.address] = std::move(stored);
}

void TokenCache::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  cache_.clear();
}

size_t TokenCache::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return cache_.size();
}

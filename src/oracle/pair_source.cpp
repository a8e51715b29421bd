#include "oracle/pair_source.hpp"
#include "cache/token_cache.hpp"
#include "node_connection/contract_reader.hpp"
#include "encoding/abi.hpp"
#include "utils/hex.hpp"
#include <cmath>
#include <mutex>

static const char* kZeroAddress = "0x0000000000000000000000000000000000000000";

long double PairReserves::Normalized0() const {
  return reserve0 / std::pow(10.0L, static_cast<long double>(decimals0));
}

long double PairReserves::Normalized1() const {
  return reserve1 / std::pow(10.0L, static_cast<long double>(decimals1));
}

bool PairReserves::Contains(const std::string& token) const {
  return SameAddress(token, token0) || SameAddress(token, token1);
}

std::optional<double> PairReserves::PriceOf(const std::string& token) const {
  const long double n0 = Normalized0();
  const long double n1 = Normalized1();
  if (n0 <= 0.0L || n1 <= 0.0L) return std::nullopt;
  if (SameAddress(token, token0)) return static_cast<double>(n1 / n0);
  if (SameAddress(token, token1)) return static_cast<double>(n0 / n1);
  return std::nullopt;
}

std::string FactoryPairSource::PairKey(const std::string& a, const std::string& b) {
  std::string aa = NormalizeAddress(a), bb = NormalizeAddress(b);
  return aa < bb ? aa + '|' + bb : bb + '|' + aa;
}

std::string FactoryPairSource::PairAddress(const std::string& a, const std::string& b) {
  const auto key = PairKey(a, b);
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = pair_cache_.find(key);
    if (it != pair_cache_.end()) return it->second;
  }
  const auto res = reader_.Call(factory_, "getPair(address,address)", {Abi::EncodeAddress(a), Abi::EncodeAddress(b)});
  std::string pair;
  if (Abi::WordCount(res) >= 1) {
    pair = Abi::DecodeAddress(res);
    if (pair == kZeroAddress) pair.clear();
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  pair_cache_[key] = pair;
  return pair;
}

PairReserves FactoryPairSource::ReadPair(const std::string& pair) {
  PairReserves r;
  r.pair = NormalizeAddress(pair);
  r.token0 = Abi::DecodeAddress(reader_.Call(r.pair, "token0()"));
  r.token1 = Abi::DecodeAddress(reader_.Call(r.pair, "token1()"));
  // getReserves() -> (uint112 reserve0, uint112 reserve1, uint32 blockTimestampLast)
  const auto res = reader_.Call(r.pair, "getReserves()");
  r.reserve0 = Abi::DecodeUint(res, 0);
  r.reserve1 = Abi::DecodeUint(res, 1);
  r.decimals0 = tokens_.Get(r.token0).decimals;
  r.decimals1 = tokens_.Get(r.token1).decimals;
  return r;
}

std::optional<PairReserves> FactoryPairSource::FindPair(const std::string& a, const std::string& b) {
  if (SameAddress(a, b)) return std::nullopt;
  const auto pair = PairAddress(a, b);
  if (pair.empty()) return std::nullopt;
  return ReadPair(pair);
}

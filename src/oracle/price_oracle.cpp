#include "oracle/price_oracle.hpp"
#include "oracle/pair_source.hpp"
#include "cache/price_cache.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <cmath>
#include <deque>
#include <sstream>
#include <unordered_set>

PriceOracle::PriceOracle(PairSource& pairs, PriceCache& cache, PriceOracleSettings settings)
  : pairs_(pairs), cache_(cache), settings_(std::move(settings)) {
  std::unordered_map<std::string, double> normalized;
  for (const auto& kv : settings_.overrides) {
    if (!UsableOverride(kv.second)) {
      Logger::Warning("price override for " + kv.first + " ignored: " + std::to_string(kv.second), __FILE__, __LINE__);
      continue;
    }
    normalized[NormalizeAddress(kv.first)] = kv.second;
  }
  settings_.overrides = std::move(normalized);
  for (auto& t : settings_.intermediates) t = NormalizeAddress(t);
  if (settings_.max_hops < 1) settings_.max_hops = 1;
}

bool PriceOracle::UsableOverride(double price) {
  return std::isfinite(price) && price >= 0.0;
}

std::string PriceOracle::CacheKey(const std::string& token, const std::string& reference) {
  return NormalizeAddress(token) + '|' + NormalizeAddress(reference);
}

std::unordered_map<std::string, double> PriceOracle::ParseOverrides(const std::string& csv) {
  std::unordered_map<std::string, double> out;
  std::istringstream iss(csv);
  std::string kv;
  while (std::getline(iss, kv, ',')) {
    if (kv.empty()) continue;
    auto pos = kv.find(':');
    if (pos == std::string::npos) {
      Logger::Warning("price override without ':' ignored: " + kv, __FILE__, __LINE__);
      continue;
    }
    double price = 0.0;
    try {
      price = std::stod(kv.substr(pos + 1));
    } catch (const std::exception& e) {
      Logger::Warning("price override '" + kv + "' ignored: " + e.what(), __FILE__, __LINE__);
      continue;
    }
    if (!UsableOverride(price)) {
      Logger::Warning("price override '" + kv + "' ignored: not a finite non-negative price", __FILE__, __LINE__);
      continue;
    }
    out[NormalizeAddress(kv.substr(0, pos))] = price;
  }
  return out;
}

std::optional<double> PriceOracle::PairPrice(const std::string& base, const std::string& quote) {
  auto pair = pairs_.FindPair(base, quote);
  if (!pair) return std::nullopt;
  return pair->PriceOf(base);
}

std::optional<double> PriceOracle::ResolvePrice(const std::string& token, const std::string& reference) {
  const std::string start = NormalizeAddress(token);
  const std::string target = NormalizeAddress(reference);
  if (start == target) return 1.0;

  if (!settings_.override_reference.empty() && SameAddress(target, settings_.override_reference)) {
    auto it = settings_.overrides.find(start);
    if (it != settings_.overrides.end()) return it->second;
  }

  const auto key = CacheKey(start, target);
  if (auto cached = cache_.Get(key)) return cached;

  struct Node {
    std::string token;
    long double multiplier;
    int hops;
  };
  std::vector<std::string> neighbours;
  neighbours.reserve(settings_.intermediates.size() + 1);
  neighbours.push_back(target);
  for (const auto& t : settings_.intermediates) {
    if (t != target) neighbours.push_back(t);
  }

  std::unordered_set<std::string> visited{start};
  std::deque<Node> frontier{Node{start, 1.0L, 0}};
  while (!frontier.empty()) {
    Node node = frontier.front();
    frontier.pop_front();
    if (node.hops >= settings_.max_hops) continue;
    for (const auto& next : neighbours) {
      if (visited.count(next)) continue;
      auto edge = PairPrice(node.token, next);
      if (!edge) continue;
      const long double m = node.multiplier * static_cast<long double>(*edge);
      if (next == target) {
        const double price = static_cast<double>(m);
        cache_.Put(key, price);
        Logger::Debug("price " + start + " = " + std::to_string(price) + " via " +
                      std::to_string(node.hops + 1) + " hop(s)", __FILE__, __LINE__);
        return price;
      }
      visited.insert(next);
      frontier.push_back(Node{next, m, node.hops + 1});
    }
  }
  Logger::Debug("price unresolved for " + start + " in " + target, __FILE__, __LINE__);
  return std::nullopt;
}

#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class PairSource;
class PriceCache;

struct PriceOracleSettings {
  // Quote tokens tried after the reference currency, in order (e.g. WBNB).
  std::vector<std::string> intermediates;
  int max_hops = 2;
  // Fixed prices in `override_reference` units, keyed by token. Parsed from PRICE_OVERRIDES.
  std::unordered_map<std::string, double> overrides;
  std::string override_reference;
};

// Resolves a token's price in a reference currency by breadth-first search over pairs.
// Results are cached per (token, reference) in the injected PriceCache.
class PriceOracle {
public:
  PriceOracle(PairSource& pairs, PriceCache& cache, PriceOracleSettings settings);

  // nullopt means no path of at most max_hops pairs reaches `reference`. Transport errors
  // from the pair source propagate as exceptions.
  std::optional<double> ResolvePrice(const std::string& token, const std::string& reference);

  // Price of `base` in units of `quote` through their direct pair only.
  std::optional<double> PairPrice(const std::string& base, const std::string& quote);

  // "token:price,token:price"; malformed, negative and non-finite entries are logged and skipped.
  static std::unordered_map<std::string, double> ParseOverrides(const std::string& csv);

private:
  static bool UsableOverride(double price);
  static std::string CacheKey(const std::string& token, const std::string& reference);

  PairSource& pairs_;
  PriceCache& cache_;
  PriceOracleSettings settings_;
};

#pragma once
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

class ContractReader;
class TokenCache;

// A two-token constant-product pair with raw reserves and the decimals needed to normalize them.
struct PairReserves {
  std::string pair;
  std::string token0;
  std::string token1;
  long double reserve0 = 0.0L;
  long double reserve1 = 0.0L;
  int decimals0 = 18;
  int decimals1 = 18;

  long double Normalized0() const;
  long double Normalized1() const;
  bool Contains(const std::string& token) const;
  // Price of `token` in units of the pair's other token; nullopt when `token` is not in the
  // pair or either normalized reserve is zero.
  std::optional<double> PriceOf(const std::string& token) const;
};

class PairSource {
public:
  virtual ~PairSource() = default;
  // nullopt when no pair exists for (a, b). Throws std::runtime_error on transport failure.
  virtual std::optional<PairReserves> FindPair(const std::string& a, const std::string& b) = 0;
};

// Pairs discovered through a V2 factory's getPair. Pair addresses are cached for the
// lifetime of the source; reserves are read fresh on every call.
class FactoryPairSource : public PairSource {
public:
  FactoryPairSource(ContractReader& reader, TokenCache& tokens, std::string factory)
    : reader_(reader), tokens_(tokens), factory_(std::move(factory)) {}

  std::optional<PairReserves> FindPair(const std::string& a, const std::string& b) override;

  // Reads token0/token1/getReserves of a known pair address.
  PairReserves ReadPair(const std::string& pair);

private:
  std::string PairAddress(const std::string& a, const std::string& b);
  static std::string PairKey(const std::string& a, const std::string& b);

  ContractReader& reader_;
  TokenCache& tokens_;
  std::string factory_;
  std::shared_mutex mutex_;
  std::unordered_map<std::string, std::string> pair_cache_;  // "a|b" (sorted) => pair or "" for none
};

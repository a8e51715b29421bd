#pragma once
#include "cache/token_cache.hpp"
#include "common/errors.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

class ContractReader;
class PriceOracle;
class HistoryProvider;

enum class OpportunityType { Farm, Lending, Vault };

const char* OpportunityTypeName(OpportunityType type);

// One pool or market as discovered by enumeration.
struct PoolRef {
  std::string protocol;
  unsigned long long index = 0;  // pid for emission-weighted pools, position in the market list otherwise
  std::string address;           // empty until the detail fetch reads it for pid-based pools

  std::string Describe() const;
};

// MasterChef farm over a two-token LP pair.
struct AmmFarmDetail {
  std::string pair;
  Token token0;  // price_usd always set
  Token token1;
  long double reserve0 = 0.0L;  // raw
  long double reserve1 = 0.0L;
  double tvl_usd = 0.0;
  double reward_per_block = 0.0;  // normalized reward token units
  double alloc_point = 0.0;
  double total_alloc_point = 0.0;
  double reward_price_usd = 0.0;  // 0 when the reward token could not be priced
  std::vector<double> token0_prices;  // oldest first
  std::vector<double> token1_prices;
  std::vector<double> tvl_history;  // pair reserve value in USD, oldest first
  std::optional<double> age_days;
  std::optional<double> volume_24h_usd;
  std::optional<double> volume_usd;
  std::optional<long long> tx_count;
};

// Compound-style market.
struct LendingMarketDetail {
  std::string market;
  Token underlying;  // price_usd always set
  double supply_rate_per_block = 0.0;  // fraction
  double borrow_rate_per_block = 0.0;
  double total_supply = 0.0;   // normalized underlying units
  double total_borrows = 0.0;
  double tvl_usd = 0.0;
  std::vector<double> underlying_prices;
  std::optional<double> age_days;
};

// FairLaunch staking over a lending vault.
struct YieldVaultDetail {
  std::string vault;
  Token underlying;  // price_usd always set
  double total_deposited = 0.0;  // normalized underlying units
  double total_debt = 0.0;
  double tvl_usd = 0.0;
  double reward_per_block = 0.0;
  double alloc_point = 0.0;
  double total_alloc_point = 0.0;
  double reward_price_usd = 0.0;
  std::vector<double> underlying_prices;
  std::optional<double> age_days;
};

struct PoolDetail {
  PoolRef ref;
  std::string address;
  std::string label;
  std::variant<AmmFarmDetail, LendingMarketDetail, YieldVaultDetail> data;
};

// Collaborators shared by every adapter of one scan. All referenced objects must outlive the adapters.
struct AdapterContext {
  ContractReader& reader;
  TokenCache& tokens;
  PriceOracle& oracle;
  HistoryProvider* history = nullptr;  // optional; without it series are empty and ages unknown
  std::string reference_token;
  int history_days = 30;
};

// Enumerates one protocol's pools and assembles the raw fields for scoring.
class ProtocolAdapter {
public:
  virtual ~ProtocolAdapter() = default;
  virtual const std::string& ProtocolId() const = 0;
  virtual OpportunityType Type() const = 0;
  // Throws when the protocol itself cannot be read.
  virtual std::vector<PoolRef> EnumeratePools() = 0;
  // Per-pool failures come back as an error value.
  virtual Result<PoolDetail> FetchPoolDetail(const PoolRef& ref) = 0;
};

namespace AdapterSupport {
  // Copies `token` with its price in the reference currency, or nullopt when unresolved.
  std::optional<Token> PricedToken(AdapterContext& ctx, const std::string& address);
  // Reward token price; 0 (logged) when unresolved.
  double RewardPrice(AdapterContext& ctx, const std::string& reward_token, const std::string& context);
  // Token price history in USD, oldest first; empty without a history provider.
  std::vector<double> TokenHistory(AdapterContext& ctx, const std::string& token);
  std::vector<PoolRef> IndexRange(const std::string& protocol, unsigned long long count);
}

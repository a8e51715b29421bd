#include "protocols/protocol_adapter.hpp"
#include "oracle/price_oracle.hpp"
#include "data/history_provider.hpp"
#include "common/logger.hpp"

const char* OpportunityTypeName(OpportunityType type) {
  switch (type) {
    case OpportunityType::Farm: return "farm";
    case OpportunityType::Lending: return "lending";
    case OpportunityType::Vault: return "vault";
  }
  return "unknown";
}

std::string PoolRef::Describe() const {
  std::string s = protocol + "#" + std::to_string(index);
  if (!address.empty()) s += " " + address;
  return s;
}

namespace AdapterSupport {
  std::optional<Token> PricedToken(AdapterContext& ctx, const std::string& address) {
    Token t = ctx.tokens.Get(address);
    auto price = ctx.oracle.ResolvePrice(t.address, ctx.reference_token);
    if (!price) return std::nullopt;
    t.price_usd = *price;
    return t;
  }

  double RewardPrice(AdapterContext& ctx, const std::string& reward_token, const std::string& context) {
    auto price = ctx.oracle.ResolvePrice(reward_token, ctx.reference_token);
    if (!price) {
      Logger::Warning("reward token " + reward_token + " unpriced for " + context + "; reward rate counts as 0",
                      __FILE__, __LINE__);
      return 0.0;
    }
    return *price;
  }

  std::vector<double> TokenHistory(AdapterContext& ctx, const std::string& token) {
    if (!ctx.history) return {};
    return SeriesValues(ctx.history->DailySeries(SeriesKind::TokenPrice, token, ctx.history_days));
  }

  std::vector<PoolRef> IndexRange(const std::string& protocol, unsigned long long count) {
    std::vector<PoolRef> refs;
    refs.reserve(static_cast<size_t>(count));
    for (unsigned long long i = 0; i < count; ++i) {
      PoolRef r;
      r.protocol = protocol;
      r.index = i;
      refs.push_back(r);
    }
    return refs;
  }
}

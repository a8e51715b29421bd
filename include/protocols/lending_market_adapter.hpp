#pragma once
#include "protocols/protocol_adapter.hpp"

struct LendingMarketConfig {
  std::string protocol_id;    // "venus"
  std::string comptroller;
  std::string native_market;  // market whose underlying is the chain's native coin
  std::string wrapped_native; // priced in its place
};

// Compound-style comptroller. Rates are per block scaled by 1e18; exchangeRateStored converts
// market tokens to raw underlying units with a 1e18 scale.
class LendingMarketAdapter : public ProtocolAdapter {
public:
  LendingMarketAdapter(AdapterContext& ctx, LendingMarketConfig config) : ctx_(ctx), config_(std::move(config)) {}

  const std::string& ProtocolId() const override { return config_.protocol_id; }
  OpportunityType Type() const override { return OpportunityType::Lending; }
  std::vector<PoolRef> EnumeratePools() override;
  Result<PoolDetail> FetchPoolDetail(const PoolRef& ref) override;

private:
  Result<PoolDetail> Assemble(const PoolRef& ref);
  std::string Underlying(const std::string& market);

  AdapterContext& ctx_;
  LendingMarketConfig config_;
};

#pragma once
#include "protocols/protocol_adapter.hpp"

struct AmmFarmConfig {
  std::string protocol_id;       // "pancakeswap", "biswap"
  std::string masterchef;
  std::string emission_method;   // "cakePerBlock()", "BSWPerBlock()"
  std::string reward_token;
};

// MasterChef v1 farm: poolInfo(pid) = (lpToken, allocPoint, lastRewardBlock, accRewardPerShare).
// Pair age, TVL history and trading activity come from `pair_history`, the subgraph indexing this
// AMM's own factory; token prices still come from the context's history.
class AmmFarmAdapter : public ProtocolAdapter {
public:
  AmmFarmAdapter(AdapterContext& ctx, AmmFarmConfig config)
    : AmmFarmAdapter(ctx, std::move(config), ctx.history) {}
  // A null `pair_history` leaves the pair-level fields unset.
  AmmFarmAdapter(AdapterContext& ctx, AmmFarmConfig config, HistoryProvider* pair_history)
    : ctx_(ctx), config_(std::move(config)), pair_history_(pair_history) {}

  const std::string& ProtocolId() const override { return config_.protocol_id; }
  OpportunityType Type() const override { return OpportunityType::Farm; }
  std::vector<PoolRef> EnumeratePools() override;
  Result<PoolDetail> FetchPoolDetail(const PoolRef& ref) override;

private:
  Result<PoolDetail> Assemble(const PoolRef& ref);
  void ReadPairHistory(AmmFarmDetail& d, const std::string& context);

  AdapterContext& ctx_;
  AmmFarmConfig config_;
  HistoryProvider* pair_history_;
};

#pragma once
#include "protocols/protocol_adapter.hpp"

struct YieldVaultConfig {
  std::string protocol_id;  // "alpaca"
  std::string fairlaunch;
  std::string reward_token;
  std::string emission_method = "alpacaPerBlock()";
};

// FairLaunch staking whose stake tokens are interest-bearing vault shares.
// poolInfo(pid) = (stakeToken, allocPoint, lastRewardBlock, accRewardPerShare, accRewardPerShareTilBonusEnd).
class YieldVaultAdapter : public ProtocolAdapter {
public:
  YieldVaultAdapter(AdapterContext& ctx, YieldVaultConfig config) : ctx_(ctx), config_(std::move(config)) {}

  const std::string& ProtocolId() const override { return config_.protocol_id; }
  OpportunityType Type() const override { return OpportunityType::Vault; }
  std::vector<PoolRef> EnumeratePools() override;
  Result<PoolDetail> FetchPoolDetail(const PoolRef& ref) override;

private:
  Result<PoolDetail> Assemble(const PoolRef& ref);

  AdapterContext& ctx_;
  YieldVaultConfig config_;
};

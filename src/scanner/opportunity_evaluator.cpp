#include "scanner/opportunity_evaluator.hpp"
#include <algorithm>
#include <type_traits>

double OpportunityEvaluator::ExpectedRoi(double rate_percent, double risk_score) {
  if (rate_percent <= 0.0) return 0.0;
  return rate_percent / 100.0 * (1.0 - Risk::Clamp01(risk_score));
}

Opportunity OpportunityEvaluator::Evaluate(const PoolDetail& detail, double protocol_reputation, long long timestamp) const {
  Opportunity o;
  o.protocol = detail.ref.protocol;
  o.address = detail.address;
  o.label = detail.label;
  o.timestamp = timestamp;
  o.factors.protocol_reputation = Risk::Clamp01(protocol_reputation);

  std::visit([&](const auto& d) {
    using T = std::decay_t<decltype(d)>;
    o.tvl_usd = d.tvl_usd;
    o.factors.tvl_risk = Risk::TvlRisk(d.tvl_usd);
    o.factors.age_risk = Risk::AgeRisk(d.age_days);
    if constexpr (std::is_same_v<T, AmmFarmDetail>) {
      o.type = OpportunityType::Farm;
      o.reward_rate = Yield::FarmApr(d.reward_per_block, settings_.blocks_per_year, d.alloc_point,
                                     d.total_alloc_point, d.reward_price_usd, d.tvl_usd);
      o.rate = o.reward_rate;
      o.rate_kind = RateKind::Apr;
      o.factors.volatility_risk = std::max(Risk::VolatilityRisk(d.token0_prices), Risk::VolatilityRisk(d.token1_prices));
      o.factors.il_risk = Risk::ImpermanentLossRisk(d.token0_prices, d.token1_prices);
      if (d.tvl_history.size() >= 2 && d.tvl_history.front() > 0.0) {
        o.extras["tvl_change_pct"] = (d.tvl_history.back() / d.tvl_history.front() - 1.0) * 100.0;
      }
      if (d.volume_24h_usd) o.extras["volume_24h_usd"] = *d.volume_24h_usd;
      if (d.volume_usd) o.extras["volume_usd"] = *d.volume_usd;
      if (d.tx_count) o.extras["tx_count"] = static_cast<double>(*d.tx_count);
    } else if constexpr (std::is_same_v<T, LendingMarketDetail>) {
      o.type = OpportunityType::Lending;
      o.base_rate = Yield::CompoundedApy(d.supply_rate_per_block, settings_.blocks_per_year);
      o.rate = o.base_rate;
      o.rate_kind = RateKind::Apy;
      o.extras["borrow_apy"] = Yield::CompoundedApy(d.borrow_rate_per_block, settings_.blocks_per_year);
      o.extras["utilization"] = Yield::Utilization(d.total_borrows, d.total_supply);
      o.factors.volatility_risk = Risk::VolatilityRisk(d.underlying_prices);
      o.factors.il_risk = 0.0;
    } else {
      o.type = OpportunityType::Vault;
      o.base_rate = Yield::VaultLendingApr(d.total_deposited, d.total_debt, settings_.max_lending_rate);
      o.reward_rate = Yield::VaultRewardApr(d.reward_per_block, settings_.blocks_per_year, d.alloc_point,
                                            d.total_alloc_point, d.reward_price_usd, d.tvl_usd);
      o.rate = o.base_rate + o.reward_rate;
      o.rate_kind = RateKind::Apr;
      o.extras["utilization"] = Yield::Utilization(d.total_debt, d.total_deposited);
      o.factors.volatility_risk = Risk::VolatilityRisk(d.underlying_prices);
      o.factors.il_risk = 0.0;
    }
  }, detail.data);

  o.risk_score = scorer_.Score(o.factors);
  // Supply-side score scaled by 1.2, capped at 1.
  if (o.type == OpportunityType::Lending) o.extras["borrow_risk_score"] = std::min(1.0, o.risk_score * 1.2);
  o.expected_roi = ExpectedRoi(o.rate, o.risk_score);
  return o;
}

#include "protocols/amm_farm_adapter.hpp"
#include "node_connection/contract_reader.hpp"
#include "data/history_provider.hpp"
#include "encoding/abi.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <cmath>

std::vector<PoolRef> AmmFarmAdapter::EnumeratePools() {
  const auto count = Abi::DecodeUint64(ctx_.reader.Call(config_.masterchef, "poolLength()"));
  Logger::Info(config_.protocol_id + ": " + std::to_string(count) + " farms", __FILE__, __LINE__);
  return AdapterSupport::IndexRange(config_.protocol_id, count);
}

Result<PoolDetail> AmmFarmAdapter::FetchPoolDetail(const PoolRef& ref) {
  try {
    return Assemble(ref);
  } catch (const std::exception& e) {
    return Result<PoolDetail>::Fail(ErrorKind::FetchFailed, ref.Describe(), e.what());
  }
}

Result<PoolDetail> AmmFarmAdapter::Assemble(const PoolRef& ref) {
  const auto info = ctx_.reader.Call(config_.masterchef, "poolInfo(uint256)", {Abi::EncodeUint(ref.index)});
  AmmFarmDetail d;
  d.pair = Abi::DecodeAddress(info, 0);
  d.alloc_point = static_cast<double>(Abi::DecodeUint(info, 1));
  d.total_alloc_point = static_cast<double>(Abi::DecodeUint(ctx_.reader.Call(config_.masterchef, "totalAllocPoint()")));

  const std::string context = ref.protocol + "#" + std::to_string(ref.index) + " " + d.pair;
  const auto t0 = Abi::DecodeAddress(ctx_.reader.Call(d.pair, "token0()"));
  const auto t1 = Abi::DecodeAddress(ctx_.reader.Call(d.pair, "token1()"));
  const auto reserves = ctx_.reader.Call(d.pair, "getReserves()");
  d.reserve0 = Abi::DecodeUint(reserves, 0);
  d.reserve1 = Abi::DecodeUint(reserves, 1);

  auto token0 = AdapterSupport::PricedToken(ctx_, t0);
  if (!token0) return Result<PoolDetail>::Fail(ErrorKind::Unresolved, context, "no price path for token0 " + t0);
  auto token1 = AdapterSupport::PricedToken(ctx_, t1);
  if (!token1) return Result<PoolDetail>::Fail(ErrorKind::Unresolved, context, "no price path for token1 " + t1);
  d.token0 = *token0;
  d.token1 = *token1;

  const long double n0 = d.reserve0 / std::pow(10.0L, static_cast<long double>(d.token0.decimals));
  const long double n1 = d.reserve1 / std::pow(10.0L, static_cast<long double>(d.token1.decimals));
  d.tvl_usd = static_cast<double>(n0 * *d.token0.price_usd + n1 * *d.token1.price_usd);

  const Token reward = ctx_.tokens.Get(config_.reward_token);
  const auto emission = Abi::DecodeUint(ctx_.reader.Call(config_.masterchef, config_.emission_method));
  d.reward_per_block = static_cast<double>(emission / std::pow(10.0L, static_cast<long double>(reward.decimals)));
  d.reward_price_usd = AdapterSupport::RewardPrice(ctx_, reward.address, context);

  d.token0_prices = AdapterSupport::TokenHistory(ctx_, d.token0.address);
  d.token1_prices = AdapterSupport::TokenHistory(ctx_, d.token1.address);
  ReadPairHistory(d, context);

  PoolDetail out;
  out.ref = ref;
  out.ref.address = d.pair;
  out.address = d.pair;
  out.label = d.token0.symbol + "-" + d.token1.symbol;
  out.data = std::move(d);
  return Result<PoolDetail>::Of(std::move(out));
}

void AmmFarmAdapter::ReadPairHistory(AmmFarmDetail& d, const std::string& context) {
  if (!pair_history_) return;
  d.age_days = pair_history_->AgeDays(SeriesKind::PairTvl, d.pair);
  d.tvl_history = SeriesValues(pair_history_->DailySeries(SeriesKind::PairTvl, d.pair, ctx_.history_days));
  // A failed activity lookup leaves only the activity unset.
  try {
    if (auto activity = pair_history_->Activity(d.pair)) {
      d.volume_24h_usd = activity->volume_24h_usd;
      d.volume_usd = activity->volume_usd;
      d.tx_count = activity->tx_count;
    }
  } catch (const std::exception& e) {
    Logger::Warning("pair activity unavailable for " + context + ": " + e.what(), __FILE__, __LINE__);
  }
}

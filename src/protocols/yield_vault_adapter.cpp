#include "protocols/yield_vault_adapter.hpp"
#include "node_connection/contract_reader.hpp"
#include "data/history_provider.hpp"
#include "encoding/abi.hpp"
#include "common/logger.hpp"
#include <cmath>

std::vector<PoolRef> YieldVaultAdapter::EnumeratePools() {
  const auto count = Abi::DecodeUint64(ctx_.reader.Call(config_.fairlaunch, "poolLength()"));
  Logger::Info(config_.protocol_id + ": " + std::to_string(count) + " staking pools", __FILE__, __LINE__);
  return AdapterSupport::IndexRange(config_.protocol_id, count);
}

Result<PoolDetail> YieldVaultAdapter::FetchPoolDetail(const PoolRef& ref) {
  try {
    return Assemble(ref);
  } catch (const std::exception& e) {
    return Result<PoolDetail>::Fail(ErrorKind::FetchFailed, ref.Describe(), e.what());
  }
}

Result<PoolDetail> YieldVaultAdapter::Assemble(const PoolRef& ref) {
  const auto info = ctx_.reader.Call(config_.fairlaunch, "poolInfo(uint256)", {Abi::EncodeUint(ref.index)});
  YieldVaultDetail d;
  d.vault = Abi::DecodeAddress(info, 0);
  d.alloc_point = static_cast<double>(Abi::DecodeUint(info, 1));
  d.total_alloc_point = static_cast<double>(Abi::DecodeUint(ctx_.reader.Call(config_.fairlaunch, "totalAllocPoint()")));
  const std::string context = ref.protocol + "#" + std::to_string(ref.index) + " " + d.vault;

  const auto token_res = ctx_.reader.Call(d.vault, "token()");
  if (Abi::WordCount(token_res) < 1) {
    return Result<PoolDetail>::Fail(ErrorKind::FetchFailed, context, "stake token is not a vault");
  }
  auto underlying = AdapterSupport::PricedToken(ctx_, Abi::DecodeAddress(token_res));
  if (!underlying) return Result<PoolDetail>::Fail(ErrorKind::Unresolved, context, "no price path for vault token");
  d.underlying = *underlying;

  const long double scale = std::pow(10.0L, static_cast<long double>(d.underlying.decimals));
  d.total_deposited = static_cast<double>(Abi::DecodeUint(ctx_.reader.Call(d.vault, "totalToken()")) / scale);
  d.total_debt = static_cast<double>(Abi::DecodeUint(ctx_.reader.Call(d.vault, "vaultDebtVal()")) / scale);
  d.tvl_usd = d.total_deposited * *d.underlying.price_usd;

  const Token reward = ctx_.tokens.Get(config_.reward_token);
  const auto emission = Abi::DecodeUint(ctx_.reader.Call(config_.fairlaunch, config_.emission_method));
  d.reward_per_block = static_cast<double>(emission / std::pow(10.0L, static_cast<long double>(reward.decimals)));
  d.reward_price_usd = AdapterSupport::RewardPrice(ctx_, reward.address, context);

  d.underlying_prices = AdapterSupport::TokenHistory(ctx_, d.underlying.address);
  if (ctx_.history) d.age_days = ctx_.history->AgeDays(SeriesKind::TokenPrice, d.underlying.address);

  const Token share = ctx_.tokens.Get(d.vault);
  PoolDetail out;
  out.ref = ref;
  out.ref.address = d.vault;
  out.address = d.vault;
  out.label = share.symbol + " (" + d.underlying.symbol + ")";
  out.data = std::move(d);
  return Result<PoolDetail>::Of(std::move(out));
}

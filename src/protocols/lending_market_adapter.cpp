#include "protocols/lending_market_adapter.hpp"
#include "node_connection/contract_reader.hpp"
#include "data/history_provider.hpp"
#include "encoding/abi.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <cmath>

static constexpr long double kMantissa = 1e18L;

std::vector<PoolRef> LendingMarketAdapter::EnumeratePools() {
  const auto markets = Abi::DecodeAddressArray(ctx_.reader.Call(config_.comptroller, "getAllMarkets()"));
  Logger::Info(config_.protocol_id + ": " + std::to_string(markets.size()) + " markets", __FILE__, __LINE__);
  std::vector<PoolRef> refs;
  refs.reserve(markets.size());
  for (size_t i = 0; i < markets.size(); ++i) {
    PoolRef r;
    r.protocol = config_.protocol_id;
    r.index = i;
    r.address = markets[i];
    refs.push_back(r);
  }
  return refs;
}

Result<PoolDetail> LendingMarketAdapter::FetchPoolDetail(const PoolRef& ref) {
  try {
    return Assemble(ref);
  } catch (const std::exception& e) {
    return Result<PoolDetail>::Fail(ErrorKind::FetchFailed, ref.Describe(), e.what());
  }
}

std::string LendingMarketAdapter::Underlying(const std::string& market) {
  if (!config_.native_market.empty() && SameAddress(market, config_.native_market)) return config_.wrapped_native;
  const auto res = ctx_.reader.Call(market, "underlying()");
  // Native markets have no underlying() and revert or return nothing.
  if (Abi::WordCount(res) < 1) return config_.wrapped_native;
  return Abi::DecodeAddress(res);
}

Result<PoolDetail> LendingMarketAdapter::Assemble(const PoolRef& ref) {
  if (ref.address.empty()) return Result<PoolDetail>::Fail(ErrorKind::FetchFailed, ref.Describe(), "market address missing");
  LendingMarketDetail d;
  d.market = NormalizeAddress(ref.address);

  const auto underlying = Underlying(d.market);
  auto token = AdapterSupport::PricedToken(ctx_, underlying);
  if (!token) return Result<PoolDetail>::Fail(ErrorKind::Unresolved, ref.Describe(), "no price path for underlying " + underlying);
  d.underlying = *token;

  d.supply_rate_per_block = static_cast<double>(Abi::DecodeUint(ctx_.reader.Call(d.market, "supplyRatePerBlock()")) / kMantissa);
  d.borrow_rate_per_block = static_cast<double>(Abi::DecodeUint(ctx_.reader.Call(d.market, "borrowRatePerBlock()")) / kMantissa);

  const long double supply_tokens = Abi::DecodeUint(ctx_.reader.Call(d.market, "totalSupply()"));
  const long double exchange_rate = Abi::DecodeUint(ctx_.reader.Call(d.market, "exchangeRateStored()"));
  const long double borrows = Abi::DecodeUint(ctx_.reader.Call(d.market, "totalBorrows()"));
  const long double scale = std::pow(10.0L, static_cast<long double>(d.underlying.decimals));
  d.total_supply = static_cast<double>(supply_tokens * exchange_rate / kMantissa / scale);
  d.total_borrows = static_cast<double>(borrows / scale);
  d.tvl_usd = d.total_supply * *d.underlying.price_usd;

  d.underlying_prices = AdapterSupport::TokenHistory(ctx_, d.underlying.address);
  if (ctx_.history) d.age_days = ctx_.history->AgeDays(SeriesKind::TokenPrice, d.underlying.address);

  const Token market_token = ctx_.tokens.Get(d.market);
  PoolDetail out;
  out.ref = ref;
  out.address = d.market;
  out.label = market_token.symbol + " (" + d.underlying.symbol + ")";
  out.data = std::move(d);
  return Result<PoolDetail>::Of(std::move(out));
}

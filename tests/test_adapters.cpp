#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "protocols/amm_farm_adapter.hpp"
#include "protocols/lending_market_adapter.hpp"
#include "protocols/yield_vault_adapter.hpp"
#include "scanner/opportunity_evaluator.hpp"
#include "oracle/price_oracle.hpp"
#include "cache/price_cache.hpp"
#include "report/opportunity_report.hpp"
#include "mocks.hpp"
#include <algorithm>

using Catch::Approx;

namespace {
const std::string REF = "0x00000000000000000000000000000000000000ee";    // 6 decimals, the reference
const std::string WBNB = "0x0000000000000000000000000000000000000001";
const std::string REWARD = "0x0000000000000000000000000000000000000003";
const std::string ORPHAN = "0x0000000000000000000000000000000000000004"; // no pairs anywhere
const std::string CHEF = "0x000000000000000000000000000000000000c0de";
const std::string LP = "0x0000000000000000000000000000000000001111";
const std::string LP_ORPHAN = "0x0000000000000000000000000000000000002222";

std::string Word(unsigned long long v) { return Abi::Pack({Abi::EncodeUint(v)}); }
std::string AddressWord(const std::string& a) { return Abi::Pack({Abi::EncodeAddress(a)}); }

// Reader, caches and oracle wired the way main() wires them, over mocked chain state.
struct Fixture {
  MockContractReader reader;
  MockPairSource pairs;
  MockHistory history;
  TokenCache tokens{reader};
  PriceCache prices;
  PriceOracle oracle{pairs, prices, [] { PriceOracleSettings s; s.intermediates = {WBNB}; return s; }()};
  AdapterContext ctx{reader, tokens, oracle, &history, REF, 30};

  Fixture() {
    reader.Erc20(REF, "USD", 6);
    reader.Erc20(WBNB, "WBNB", 6);
    reader.Erc20(REWARD, "RWD", 18);
    reader.Erc20(ORPHAN, "ORPH", 18);
    pairs.Add(WBNB, REF, 1e6L, 300e6L, 6, 6);      // WBNB = 300
    pairs.Add(REWARD, WBNB, 300e18L, 2e6L, 18, 6); // RWD = 2/300 WBNB = 2
  }
};
}

TEST_CASE("AMM farm adapter assembles reserves, prices and history", "[adapters]") {
  Fixture f;
  auto& r = f.reader;
  r.On(CHEF, "poolLength()", Word(2));
  r.On(CHEF, "totalAllocPoint()", Word(100));
  r.On(CHEF, "cakePerBlock()", Word(10000000000000000000ULL));  // 10 RWD
  r.On(CHEF, "poolInfo(uint256)", Abi::Pack({Abi::EncodeAddress(LP), Abi::EncodeUint(40), Abi::EncodeUint(0), Abi::EncodeUint(0)}),
       {Abi::EncodeUint(1)});
  r.On(LP, "token0()", AddressWord(WBNB));
  r.On(LP, "token1()", AddressWord(REF));
  r.On(LP, "getReserves()", Abi::Pack({Abi::EncodeUint(1000000000ULL), Abi::EncodeUint(300000000000ULL), Abi::EncodeUint(0)}));
  f.history.token_series[WBNB] = {290.0, 300.0, 310.0};
  f.history.token_series[REF] = {1.0, 1.0, 1.0};
  f.history.ages[LP] = 500.0;

  AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"pancakeswap", CHEF, "cakePerBlock()", REWARD});
  REQUIRE(adapter.Type() == OpportunityType::Farm);
  auto refs = adapter.EnumeratePools();
  REQUIRE(refs.size() == 2);
  REQUIRE(refs[1].index == 1);

  auto result = adapter.FetchPoolDetail(refs[1]);
  REQUIRE(result.IsOk());
  const auto& detail = result.Value();
  REQUIRE(detail.address == LP);
  REQUIRE(detail.label == "WBNB-USD");
  const auto& farm = std::get<AmmFarmDetail>(detail.data);
  REQUIRE(farm.tvl_usd == Approx(600000.0));  // 1000 * 300 + 300000 * 1
  REQUIRE(farm.alloc_point == 40.0);
  REQUIRE(farm.total_alloc_point == 100.0);
  REQUIRE(farm.reward_per_block == Approx(10.0));
  REQUIRE(farm.reward_price_usd == Approx(2.0));
  REQUIRE(farm.token0_prices.size() == 3);
  REQUIRE(farm.age_days.value() == 500.0);

  OpportunityEvaluator evaluator(RiskScorer(), EvaluationSettings());
  auto o = evaluator.Evaluate(detail, 0.8, 1700000000);
  // 10 * 10512000 * 0.4 * 2 / 600000 * 100
  REQUIRE(o.rate == Approx(14016.0));
  REQUIRE(o.rate_kind == RateKind::Apr);
  REQUIRE(o.factors.tvl_risk == 0.7);
  REQUIRE(o.factors.age_risk == 0.2);
  REQUIRE(o.expected_roi == Approx(o.rate / 100.0 * (1.0 - o.risk_score)));
}

TEST_CASE("AMM farm reports an unpriceable constituent as unresolved", "[adapters]") {
  Fixture f;
  auto& r = f.reader;
  r.On(CHEF, "totalAllocPoint()", Word(100));
  r.On(CHEF, "cakePerBlock()", Word(1000000000000000000ULL));
  r.On(CHEF, "poolInfo(uint256)", Abi::Pack({Abi::EncodeAddress(LP_ORPHAN), Abi::EncodeUint(10), Abi::EncodeUint(0), Abi::EncodeUint(0)}),
       {Abi::EncodeUint(0)});
  r.On(LP_ORPHAN, "token0()", AddressWord(ORPHAN));
  r.On(LP_ORPHAN, "token1()", AddressWord(REF));
  r.On(LP_ORPHAN, "getReserves()", Abi::Pack({Abi::EncodeUint(5), Abi::EncodeUint(5), Abi::EncodeUint(0)}));

  AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"biswap", CHEF, "cakePerBlock()", REWARD});
  PoolRef ref;
  ref.protocol = "biswap";
  ref.index = 0;
  auto result = adapter.FetchPoolDetail(ref);
  REQUIRE_FALSE(result.IsOk());
  REQUIRE(result.Error().kind == ErrorKind::Unresolved);
}

TEST_CASE("AMM farm treats an unpriceable reward token as zero reward", "[adapters]") {
  Fixture f;
  auto& r = f.reader;
  r.On(CHEF, "totalAllocPoint()", Word(100));
  r.On(CHEF, "BSWPerBlock()", Word(1000000000000000000ULL));
  r.On(CHEF, "poolInfo(uint256)", Abi::Pack({Abi::EncodeAddress(LP), Abi::EncodeUint(10), Abi::EncodeUint(0), Abi::EncodeUint(0)}),
       {Abi::EncodeUint(0)});
  r.On(LP, "token0()", AddressWord(WBNB));
  r.On(LP, "token1()", AddressWord(REF));
  r.On(LP, "getReserves()", Abi::Pack({Abi::EncodeUint(1000000ULL), Abi::EncodeUint(300000000ULL), Abi::EncodeUint(0)}));

  AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"biswap", CHEF, "BSWPerBlock()", ORPHAN});
  PoolRef ref;
  ref.protocol = "biswap";
  auto result = adapter.FetchPoolDetail(ref);
  REQUIRE(result.IsOk());
  REQUIRE(std::get<AmmFarmDetail>(result.Value().data).reward_price_usd == 0.0);
}

TEST_CASE("Farm enumeration failure surfaces as an exception", "[adapters]") {
  Fixture f;
  f.reader.Fail(CHEF, "poolLength()");
  AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"pancakeswap", CHEF, "cakePerBlock()", REWARD});
  REQUIRE_THROWS(adapter.EnumeratePools());
}

TEST_CASE("Per-pool read failures come back as fetch errors", "[adapters]") {
  Fixture f;
  f.reader.Fail(CHEF, "poolInfo(uint256)", {Abi::EncodeUint(7)});
  AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"pancakeswap", CHEF, "cakePerBlock()", REWARD});
  PoolRef ref;
  ref.protocol = "pancakeswap";
  ref.index = 7;
  auto result = adapter.FetchPoolDetail(ref);
  REQUIRE_FALSE(result.IsOk());
  REQUIRE(result.Error().kind == ErrorKind::FetchFailed);
  REQUIRE(result.Error().context == "pancakeswap#7");
}

TEST_CASE("Lending adapter decodes markets and maps the native market", "[adapters]") {
  Fixture f;
  auto& r = f.reader;
  const std::string comptroller = "0x000000000000000000000000000000000000c0c0";
  const std::string vnative = "0x000000000000000000000000000000000000a001";
  const std::string vusd = "0x000000000000000000000000000000000000a002";
  r.On(comptroller, "getAllMarkets()", Abi::Pack({"20", "2", Abi::EncodeAddress(vnative), Abi::EncodeAddress(vusd)}));
  r.Erc20(vusd, "vUSD", 8);
  r.Erc20(vnative, "vBNB", 8);
  r.On(vusd, "underlying()", AddressWord(REF));
  for (const auto& m : {vusd, vnative}) {
    r.On(m, "supplyRatePerBlock()", Word(30000000000ULL));  // 3e-8 per block
    r.On(m, "borrowRatePerBlock()", Word(50000000000ULL));
    r.On(m, "totalSupply()", Word(50000000000000000ULL));   // 5e8 market tokens
    r.On(m, "exchangeRateStored()", Word(200000000000000ULL)); // 0.02 underlying per market token
    r.On(m, "totalBorrows()", Word(4000000000000ULL));
  }

  LendingMarketAdapter adapter(f.ctx, LendingMarketConfig{"venus", comptroller, vnative, WBNB});
  auto refs = adapter.EnumeratePools();
  REQUIRE(refs.size() == 2);
  REQUIRE(refs[1].address == vusd);

  auto usd = adapter.FetchPoolDetail(refs[1]);
  REQUIRE(usd.IsOk());
  const auto& market = std::get<LendingMarketDetail>(usd.Value().data);
  REQUIRE(market.underlying.address == REF);
  REQUIRE(market.supply_rate_per_block == Approx(3e-8));
  REQUIRE(market.total_supply == Approx(1e7));
  REQUIRE(market.total_borrows == Approx(4e6));
  REQUIRE(market.tvl_usd == Approx(1e7));
  REQUIRE(usd.Value().label == "vUSD (USD)");

  auto native = adapter.FetchPoolDetail(refs[0]);
  REQUIRE(native.IsOk());
  const auto& bnb = std::get<LendingMarketDetail>(native.Value().data);
  REQUIRE(bnb.underlying.address == WBNB);
  REQUIRE(bnb.tvl_usd == Approx(1e7 * 300.0));

  OpportunityEvaluator evaluator(RiskScorer(), EvaluationSettings());
  auto o = evaluator.Evaluate(usd.Value(), 0.9, 0);
  REQUIRE(o.type == OpportunityType::Lending);
  REQUIRE(o.rate_kind == RateKind::Apy);
  REQUIRE(o.rate == Approx(Yield::CompoundedApy(3e-8)));
  REQUIRE(o.extras.at("utilization") == Approx(40.0));
  REQUIRE(o.extras.at("borrow_apy") > o.rate);
  REQUIRE(o.extras.at("borrow_risk_score") == Approx(std::min(1.0, o.risk_score * 1.2)));
  REQUIRE(o.factors.il_risk == 0.0);
}

TEST_CASE("Borrow risk scales the supply risk and caps at one", "[adapters]") {
  RiskWeights protocol_only;
  protocol_only.tvl = protocol_only.volatility = protocol_only.age = protocol_only.il = 0.0;
  protocol_only.protocol = 1.0;
  OpportunityEvaluator evaluator(RiskScorer(protocol_only, RiskScorer::DefaultBaseScores()), EvaluationSettings());
  const auto market = LendingDetail("0x00000000000000000000000000000000000000a9", 3e-8, 2e7);

  auto safe = evaluator.Evaluate(market, 0.5, 0);
  REQUIRE(safe.risk_score == Approx(0.5));
  REQUIRE(safe.extras.at("borrow_risk_score") == Approx(0.6));

  auto unknown = evaluator.Evaluate(market, 0.0, 0);
  REQUIRE(unknown.risk_score == Approx(1.0));
  REQUIRE(unknown.extras.at("borrow_risk_score") == 1.0);
  REQUIRE(OpportunityReport::ToJson(unknown)["extras"]["borrow_risk_score"].get<double>() == 1.0);
}

TEST_CASE("Vault adapter combines lending and reward rates", "[adapters]") {
  Fixture f;
  auto& r = f.reader;
  const std::string fairlaunch = "0x000000000000000000000000000000000000fa11";
  const std::string vault = "0x000000000000000000000000000000000000b001";
  r.On(fairlaunch, "poolLength()", Word(1));
  r.On(fairlaunch, "totalAllocPoint()", Word(100));
  r.On(fairlaunch, "alpacaPerBlock()", Word(1000000000000000000ULL));
  r.On(fairlaunch, "poolInfo(uint256)",
       Abi::Pack({Abi::EncodeAddress(vault), Abi::EncodeUint(50), Abi::EncodeUint(0), Abi::EncodeUint(0), Abi::EncodeUint(0)}),
       {Abi::EncodeUint(0)});
  r.Erc20(vault, "ibUSD", 6);
  r.On(vault, "token()", AddressWord(REF));
  r.On(vault, "totalToken()", Word(10000000000000ULL));  // 1e7 USD
  r.On(vault, "vaultDebtVal()", Word(6000000000000ULL));

  YieldVaultAdapter adapter(f.ctx, YieldVaultConfig{"alpaca", fairlaunch, REWARD, "alpacaPerBlock()"});
  auto refs = adapter.EnumeratePools();
  REQUIRE(refs.size() == 1);
  auto result = adapter.FetchPoolDetail(refs[0]);
  REQUIRE(result.IsOk());
  const auto& v = std::get<YieldVaultDetail>(result.Value().data);
  REQUIRE(v.total_deposited == Approx(1e7));
  REQUIRE(v.total_debt == Approx(6e6));
  REQUIRE(v.reward_price_usd == Approx(2.0));

  OpportunityEvaluator evaluator(RiskScorer(), EvaluationSettings());
  auto o = evaluator.Evaluate(result.Value(), 0.8, 0);
  REQUIRE(o.type == OpportunityType::Vault);
  REQUIRE(o.base_rate == Approx(6.0));      // 40% idle * 15%
  REQUIRE(o.reward_rate == Approx(105.12)); // 1 * 10512000 * 0.5 * 2 / 1e7 * 100
  REQUIRE(o.rate == Approx(o.base_rate + o.reward_rate));
}

namespace {
// Biswap farm pid 0 over LP (1000 WBNB / 300000 USD), as the Biswap MasterChef reports it.
void MockBiswapFarm(MockContractReader& r) {
  r.On(CHEF, "totalAllocPoint()", Word(100));
  r.On(CHEF, "BSWPerBlock()", Word(1000000000000000000ULL));
  r.On(CHEF, "poolInfo(uint256)", Abi::Pack({Abi::EncodeAddress(LP), Abi::EncodeUint(10), Abi::EncodeUint(0), Abi::EncodeUint(0)}),
       {Abi::EncodeUint(0)});
  r.On(LP, "token0()", AddressWord(WBNB));
  r.On(LP, "token1()", AddressWord(REF));
  r.On(LP, "getReserves()", Abi::Pack({Abi::EncodeUint(1000000000ULL), Abi::EncodeUint(300000000000ULL), Abi::EncodeUint(0)}));
}

PoolRef BiswapRef() {
  PoolRef ref;
  ref.protocol = "biswap";
  return ref;
}
}

TEST_CASE("Biswap farms take pair history from their own subgraph", "[adapters]") {
  Fixture f;
  MockBiswapFarm(f.reader);
  f.history.token_series[WBNB] = {290.0, 300.0, 310.0};  // token prices stay on the shared history

  MockHistory biswap;
  biswap.ages[LP] = 200.0;
  biswap.pair_series[LP] = {500000.0, 550000.0, 600000.0};
  biswap.activity[LP] = PairActivity{125000.0, 9.5e7, 4321};

  AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"biswap", CHEF, "BSWPerBlock()", REWARD}, &biswap);
  auto result = adapter.FetchPoolDetail(BiswapRef());
  REQUIRE(result.IsOk());
  const auto& farm = std::get<AmmFarmDetail>(result.Value().data);
  REQUIRE(farm.age_days.value() == 200.0);
  REQUIRE(farm.token0_prices.size() == 3);
  REQUIRE(farm.tvl_history.size() == 3);
  REQUIRE(farm.volume_24h_usd.value() == 125000.0);
  REQUIRE(farm.volume_usd.value() == 9.5e7);
  REQUIRE(farm.tx_count.value() == 4321);

  OpportunityEvaluator evaluator(RiskScorer(), EvaluationSettings());
  auto o = evaluator.Evaluate(result.Value(), 0.6, 0);
  REQUIRE(o.factors.age_risk == 0.4);
  REQUIRE(o.extras.at("tvl_change_pct") == Approx(20.0));
  REQUIRE(o.extras.at("volume_24h_usd") == 125000.0);
  REQUIRE(o.extras.at("tx_count") == 4321.0);
  const auto j = OpportunityReport::ToJson(o);
  REQUIRE(j["extras"]["volume_usd"].get<double>() == 9.5e7);
}

TEST_CASE("Farm pair history comes only from the provider it was given", "[adapters]") {
  Fixture f;
  MockBiswapFarm(f.reader);
  f.history.ages[LP] = 500.0;

  SECTION("the shared history serves a farm built without its own") {
    AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"pancakeswap", CHEF, "BSWPerBlock()", REWARD});
    auto result = adapter.FetchPoolDetail(BiswapRef());
    REQUIRE(result.IsOk());
    REQUIRE(std::get<AmmFarmDetail>(result.Value().data).age_days.value() == 500.0);
  }

  SECTION("no pair history leaves age and activity unknown") {
    AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"biswap", CHEF, "BSWPerBlock()", REWARD}, nullptr);
    auto result = adapter.FetchPoolDetail(BiswapRef());
    REQUIRE(result.IsOk());
    const auto& farm = std::get<AmmFarmDetail>(result.Value().data);
    REQUIRE_FALSE(farm.age_days.has_value());
    REQUIRE(farm.tvl_history.empty());
    REQUIRE_FALSE(farm.volume_24h_usd.has_value());

    OpportunityEvaluator evaluator(RiskScorer(), EvaluationSettings());
    auto o = evaluator.Evaluate(result.Value(), 0.6, 0);
    REQUIRE(o.factors.age_risk == 1.0);
    REQUIRE(o.extras.count("tvl_change_pct") == 0);
    REQUIRE(o.extras.count("volume_24h_usd") == 0);
  }
}

TEST_CASE("Pair activity failures keep the pool", "[adapters]") {
  Fixture f;
  MockBiswapFarm(f.reader);
  MockHistory biswap;
  biswap.ages[LP] = 40.0;
  biswap.activity_fails = true;

  AmmFarmAdapter adapter(f.ctx, AmmFarmConfig{"biswap", CHEF, "BSWPerBlock()", REWARD}, &biswap);
  auto result = adapter.FetchPoolDetail(BiswapRef());
  REQUIRE(result.IsOk());
  const auto& farm = std::get<AmmFarmDetail>(result.Value().data);
  REQUIRE(farm.age_days.value() == 40.0);
  REQUIRE_FALSE(farm.tx_count.has_value());
}

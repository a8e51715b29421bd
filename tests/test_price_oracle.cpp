#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "oracle/price_oracle.hpp"
#include "cache/price_cache.hpp"
#include "cache/token_cache.hpp"
#include "mocks.hpp"
#include <limits>

using Catch::Approx;

namespace {
const std::string TOKEN_A = "0x00000000000000000000000000000000000000aa";
const std::string TOKEN_B = "0x00000000000000000000000000000000000000bb";
const std::string REF = "0x00000000000000000000000000000000000000ee";
const std::string WBNB = "0x0000000000000000000000000000000000000001";
const std::string USDT = "0x0000000000000000000000000000000000000002";

PriceOracleSettings Settings(int max_hops = 2) {
  PriceOracleSettings s;
  s.intermediates = {WBNB, USDT};
  s.max_hops = max_hops;
  return s;
}
}

TEST_CASE("Pair prices are reciprocal", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  pairs.Add(TOKEN_A, TOKEN_B, 1000e18L, 2500e18L);
  pairs.Add(TOKEN_A, USDT, 5e18L, 7e6L, 18, 6);
  PriceOracle oracle(pairs, cache, Settings());

  auto ab = oracle.PairPrice(TOKEN_A, TOKEN_B);
  auto ba = oracle.PairPrice(TOKEN_B, TOKEN_A);
  REQUIRE(ab.has_value());
  REQUIRE(ba.has_value());
  REQUIRE(*ab == Approx(2.5));
  REQUIRE(*ab * *ba == Approx(1.0));

  auto a_usdt = oracle.PairPrice(TOKEN_A, USDT);
  auto usdt_a = oracle.PairPrice(USDT, TOKEN_A);
  REQUIRE(*a_usdt == Approx(1.4));
  REQUIRE(*a_usdt * *usdt_a == Approx(1.0));
}

TEST_CASE("Token equal to the reference resolves to one without lookups", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  PriceOracle oracle(pairs, cache, Settings());
  auto p = oracle.ResolvePrice(REF, "0x00000000000000000000000000000000000000EE");
  REQUIRE(p.has_value());
  REQUIRE(*p == 1.0);
  REQUIRE(pairs.lookups == 0);
}

TEST_CASE("Direct pair to the reference is preferred", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  pairs.Add(TOKEN_A, REF, 100e18L, 250e18L);
  pairs.Add(TOKEN_A, WBNB, 100e18L, 1e18L);
  pairs.Add(WBNB, REF, 1e18L, 300e18L);
  PriceOracle oracle(pairs, cache, Settings());
  auto p = oracle.ResolvePrice(TOKEN_A, REF);
  REQUIRE(p.has_value());
  REQUIRE(*p == Approx(2.5));
}

TEST_CASE("Two-hop path through an intermediate multiplies edge prices", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  pairs.Add(TOKEN_A, WBNB, 1000e18L, 10e18L);
  pairs.Add(REF, WBNB, 300e18L, 1e18L);
  PriceOracle oracle(pairs, cache, Settings());
  auto p = oracle.ResolvePrice(TOKEN_A, REF);
  REQUIRE(p.has_value());
  REQUIRE(*p == Approx(3.0));
}

TEST_CASE("No path within the hop limit is unresolved, not an error", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  pairs.Add(TOKEN_A, WBNB, 1000e18L, 10e18L);
  pairs.Add(WBNB, USDT, 1e18L, 300e6L, 18, 6);
  pairs.Add(USDT, REF, 1e6L, 1e18L, 6, 18);

  SECTION("three hops exceed the default limit") {
    PriceOracle oracle(pairs, cache, Settings());
    std::optional<double> p;
    REQUIRE_NOTHROW(p = oracle.ResolvePrice(TOKEN_A, REF));
    REQUIRE_FALSE(p.has_value());
  }
  SECTION("a token with no pairs at all") {
    PriceOracle oracle(pairs, cache, Settings());
    REQUIRE_FALSE(oracle.ResolvePrice(TOKEN_B, REF).has_value());
  }
  SECTION("raising the limit finds the longer path") {
    PriceOracle oracle(pairs, cache, Settings(3));
    auto p = oracle.ResolvePrice(TOKEN_A, REF);
    REQUIRE(p.has_value());
    REQUIRE(*p == Approx(3.0));
  }
}

TEST_CASE("Pairs with an empty side are not edges", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  pairs.Add(TOKEN_A, REF, 0.0L, 250e18L);
  PriceOracle oracle(pairs, cache, Settings());
  REQUIRE_FALSE(oracle.PairPrice(TOKEN_A, REF).has_value());
  REQUIRE_FALSE(oracle.ResolvePrice(TOKEN_A, REF).has_value());
}

TEST_CASE("Resolved prices are served from the cache until they expire", "[oracle]") {
  MockPairSource pairs;
  auto now = std::chrono::steady_clock::time_point(std::chrono::hours(1));
  PriceCache cache(std::chrono::seconds(300), [&now]{ return now; });
  pairs.Add(TOKEN_A, REF, 100e18L, 250e18L);
  PriceOracle oracle(pairs, cache, Settings());

  REQUIRE(*oracle.ResolvePrice(TOKEN_A, REF) == Approx(2.5));
  const int after_first = pairs.lookups;
  REQUIRE(*oracle.ResolvePrice(TOKEN_A, REF) == Approx(2.5));
  REQUIRE(pairs.lookups == after_first);

  now += std::chrono::seconds(301);
  REQUIRE(*oracle.ResolvePrice(TOKEN_A, REF) == Approx(2.5));
  REQUIRE(pairs.lookups > after_first);
}

TEST_CASE("Transport failures from the pair source propagate", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  pairs.throw_on_lookup = true;
  PriceOracle oracle(pairs, cache, Settings());
  REQUIRE_THROWS_AS(oracle.ResolvePrice(TOKEN_A, REF), std::runtime_error);
}

TEST_CASE("Overrides apply only to their reference currency", "[oracle]") {
  MockPairSource pairs;
  PriceCache cache;
  PriceOracleSettings s = Settings();
  s.overrides = PriceOracle::ParseOverrides(TOKEN_B + ":4.5,garbage," + TOKEN_A + ":notanumber");
  s.override_reference = REF;
  REQUIRE(s.overrides.size() == 1);
  PriceOracle oracle(pairs, cache, s);
  REQUIRE(*oracle.ResolvePrice(TOKEN_B, REF) == Approx(4.5));
  REQUIRE_FALSE(oracle.ResolvePrice(TOKEN_B, WBNB).has_value());
}

TEST_CASE("Negative and non-finite overrides are dropped", "[oracle]") {
  auto parsed = PriceOracle::ParseOverrides(TOKEN_A + ":-1," + TOKEN_B + ":nan," + WBNB + ":inf," +
                                            USDT + ":1e400," + REF + ":0.25");
  REQUIRE(parsed.size() == 1);
  REQUIRE(parsed.at(REF) == Approx(0.25));

  MockPairSource pairs;
  PriceCache cache;
  PriceOracleSettings s = Settings();
  s.overrides[TOKEN_A] = std::numeric_limits<double>::quiet_NaN();
  s.overrides[TOKEN_B] = -3.0;
  s.overrides[WBNB] = 310.0;
  s.override_reference = REF;
  PriceOracle oracle(pairs, cache, s);
  REQUIRE_FALSE(oracle.ResolvePrice(TOKEN_A, REF).has_value());
  REQUIRE_FALSE(oracle.ResolvePrice(TOKEN_B, REF).has_value());
  REQUIRE(*oracle.ResolvePrice(WBNB, REF) == Approx(310.0));
}

namespace {
const std::string FACTORY = "0x000000000000000000000000000000000000fac7";
const std::string PAIR = "0x0000000000000000000000000000000000005555";
const std::string ZERO = "0x0000000000000000000000000000000000000000";

std::string AddressWord(const std::string& a) { return Abi::Pack({Abi::EncodeAddress(a)}); }
}

TEST_CASE("Factory pair source reads pairs through getPair", "[oracle]") {
  MockContractReader reader;
  TokenCache tokens(reader);
  reader.Erc20(TOKEN_A, "AAA", 18);
  reader.Erc20(USDT, "USDT", 6);
  reader.On(FACTORY, "getPair(address,address)", AddressWord(ZERO), {Abi::EncodeAddress(TOKEN_A), Abi::EncodeAddress(TOKEN_B)});
  reader.On(FACTORY, "getPair(address,address)", AddressWord(PAIR), {Abi::EncodeAddress(TOKEN_A), Abi::EncodeAddress(USDT)});
  // The pair orders its tokens the other way round from the lookup.
  reader.On(PAIR, "token0()", AddressWord(USDT));
  reader.On(PAIR, "token1()", AddressWord(TOKEN_A));
  reader.On(PAIR, "getReserves()", Abi::Pack({Abi::EncodeUint(7000000ULL), Abi::EncodeUint(5000000000000000000ULL),
                                              Abi::EncodeUint(0)}));
  FactoryPairSource source(reader, tokens, FACTORY);

  SECTION("zero address from the factory means no pair") {
    REQUIRE_FALSE(source.FindPair(TOKEN_A, TOKEN_B).has_value());
    const int calls = reader.calls.load();
    REQUIRE_FALSE(source.FindPair(TOKEN_B, TOKEN_A).has_value());
    REQUIRE(reader.calls.load() == calls);
  }

  SECTION("reserves follow the pair's token0 and are normalized by decimals") {
    auto p = source.FindPair(TOKEN_A, USDT);
    REQUIRE(p.has_value());
    REQUIRE(p->pair == PAIR);
    REQUIRE(p->token0 == USDT);
    REQUIRE(p->decimals0 == 6);
    REQUIRE(p->decimals1 == 18);
    REQUIRE(static_cast<double>(p->Normalized0()) == Approx(7.0));
    REQUIRE(static_cast<double>(p->Normalized1()) == Approx(5.0));
    REQUIRE(*p->PriceOf(TOKEN_A) == Approx(1.4));
    REQUIRE(*p->PriceOf(USDT) == Approx(5.0 / 7.0));

    PriceCache cache;
    PriceOracle oracle(source, cache, Settings());
    REQUIRE(*oracle.ResolvePrice(TOKEN_A, USDT) == Approx(1.4));
  }
}

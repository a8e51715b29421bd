#include <catch2/catch_test_macros.hpp>
#include "cache/price_cache.hpp"
#include "cache/token_cache.hpp"
#include "mocks.hpp"
#include <thread>
#include <vector>

TEST_CASE("Price cache entries expire after the TTL", "[cache]") {
  auto now = std::chrono::steady_clock::time_point(std::chrono::hours(2));
  PriceCache cache(std::chrono::seconds(300), [&now]{ return now; });
  cache.Put("a|ref", 1.25);
  REQUIRE(cache.Get("a|ref").value() == 1.25);

  now += std::chrono::seconds(299);
  REQUIRE(cache.Get("a|ref").has_value());
  now += std::chrono::seconds(1);
  REQUIRE_FALSE(cache.Get("a|ref").has_value());

  REQUIRE(cache.Size() == 1);
  REQUIRE(cache.Purge() == 1);
  REQUIRE(cache.Size() == 0);
}

TEST_CASE("Refreshing an entry replaces price and expiry", "[cache]") {
  auto now = std::chrono::steady_clock::time_point(std::chrono::hours(2));
  PriceCache cache(std::chrono::seconds(10), [&now]{ return now; });
  cache.Put("k", 1.0);
  now += std::chrono::seconds(8);
  cache.Put("k", 2.0);
  now += std::chrono::seconds(8);
  REQUIRE(cache.Get("k").value() == 2.0);
  cache.Invalidate("k");
  REQUIRE_FALSE(cache.Get("k").has_value());
}

TEST_CASE("Concurrent writers leave one of the written values", "[cache]") {
  PriceCache cache;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t]{
      for (int i = 0; i < 1000; ++i) cache.Put("shared", static_cast<double>(t));
    });
  }
  for (auto& th : threads) th.join();
  const double v = cache.Get("shared").value();
  REQUIRE(v >= 0.0);
  REQUIRE(v <= 3.0);
}

TEST_CASE("Token cache fetches metadata once per cycle", "[cache]") {
  MockContractReader reader;
  const std::string cake = "0x0E09FaBB73Bd3Ade0a17ECC321fD13a19e81cE82";
  reader.Erc20(cake, "Cake", 18);
  TokenCache tokens(reader);

  Token t = tokens.Get(cake);
  REQUIRE(t.symbol == "Cake");
  REQUIRE(t.decimals == 18);
  REQUIRE(t.address == "0x0e09fabb73bd3ade0a17ecc321fd13a19e81ce82");
  const int calls = reader.calls.load();
  tokens.Get(cake);
  REQUIRE(reader.calls.load() == calls);

  tokens.Clear();
  tokens.Get(cake);
  REQUIRE(reader.calls.load() > calls);
}

TEST_CASE("Token cache tolerates a missing symbol but not missing decimals", "[cache]") {
  MockContractReader reader;
  const std::string odd = "0x00000000000000000000000000000000000000cc";
  reader.On(odd, "decimals()", Abi::Pack({Abi::EncodeUint(6)}));
  reader.Fail(odd, "symbol()");
  TokenCache tokens(reader);
  REQUIRE(tokens.Get(odd).symbol == "?");

  const std::string broken = "0x00000000000000000000000000000000000000dd";
  reader.Fail(broken, "decimals()");
  REQUIRE_THROWS(tokens.Get(broken));
}

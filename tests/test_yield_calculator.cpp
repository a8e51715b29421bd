#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "yield/yield_calculator.hpp"
#include <cmath>

using Catch::Approx;

TEST_CASE("Emission rate annualizes the pool's share of rewards", "[yield]") {
  // 40 tokens/block, 10% of allocation, $2 reward token, $100M pool.
  const double rate = Yield::ComputeRate(40.0, 10512000.0, 10.0, 100.0, 2.0, 1e8);
  REQUIRE(rate == Approx(84.096));
  REQUIRE(Yield::FarmApr(40.0, 10512000.0, 10.0, 100.0, 2.0, 1e8) == Approx(rate));
  REQUIRE(Yield::VaultRewardApr(40.0, 10512000.0, 10.0, 100.0, 2.0, 1e8) == Approx(rate));
}

TEST_CASE("Emission rate is exactly zero for degenerate inputs", "[yield]") {
  REQUIRE(Yield::ComputeRate(40.0, 10512000.0, 10.0, 0.0, 2.0, 1e6) == 0.0);
  REQUIRE(Yield::ComputeRate(40.0, 10512000.0, 10.0, 100.0, 2.0, 0.0) == 0.0);
  REQUIRE(Yield::ComputeRate(-1.0, 10512000.0, 10.0, 100.0, 2.0, 1e6) == 0.0);
  REQUIRE(Yield::ComputeRate(40.0, 10512000.0, 10.0, 100.0, -2.0, 1e6) == 0.0);
  REQUIRE(Yield::ComputeRate(40.0, 10512000.0, 0.0, 100.0, 2.0, 1e6) == 0.0);
}

TEST_CASE("Compounded APY keeps precision for tiny per-block rates", "[yield]") {
  const double tiny = Yield::CompoundedApy(1e-12, 10512000.0);
  REQUIRE(std::isfinite(tiny));
  REQUIRE(tiny > 0.0);
  REQUIRE(tiny == Approx(100.0 * 1.0512e-5).epsilon(1e-4));

  // Typical lending market rate, about 37%.
  const double r = 3e-8;
  const long double expected = 100.0L * (std::pow(1.0L + r, 10512000.0L) - 1.0L);
  REQUIRE(Yield::CompoundedApy(r, 10512000.0) == Approx(static_cast<double>(expected)).epsilon(1e-9));
  REQUIRE(Yield::CompoundedApy(r) > Yield::SimpleApr(r));
}

TEST_CASE("Non-positive per-block rates compound to zero", "[yield]") {
  REQUIRE(Yield::CompoundedApy(0.0) == 0.0);
  REQUIRE(Yield::CompoundedApy(-1e-9) == 0.0);
  REQUIRE(Yield::SimpleApr(-1e-9) == 0.0);
  REQUIRE(Yield::SimpleApr(1e-8, 10512000.0) == Approx(10.512));
}

TEST_CASE("Vault lending APR scales idle funds by the rate ceiling", "[yield]") {
  REQUIRE(Yield::VaultLendingApr(1000.0, 400.0, 0.15) == Approx(9.0));
  REQUIRE(Yield::VaultLendingApr(1000.0, 0.0) == Approx(15.0));
  REQUIRE(Yield::VaultLendingApr(1000.0, 1500.0) == 0.0);
  REQUIRE(Yield::VaultLendingApr(0.0, 0.0) == 0.0);
}

TEST_CASE("Utilization is borrowed over supplied", "[yield]") {
  REQUIRE(Yield::Utilization(25.0, 100.0) == Approx(25.0));
  REQUIRE(Yield::Utilization(25.0, 0.0) == 0.0);
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "risk/risk_scorer.hpp"
#include <vector>

using Catch::Approx;

TEST_CASE("TVL risk steps down at each threshold", "[risk]") {
  REQUIRE(Risk::TvlRisk(10000001.0) == 0.1);
  REQUIRE(Risk::TvlRisk(10000000.0) == 0.1);
  REQUIRE(Risk::TvlRisk(9999999.0) == 0.3);
  REQUIRE(Risk::TvlRisk(5000000.0) == 0.3);
  REQUIRE(Risk::TvlRisk(1000000.0) == 0.5);
  REQUIRE(Risk::TvlRisk(500000.0) == 0.7);
  REQUIRE(Risk::TvlRisk(499999.0) == 0.9);
  REQUIRE(Risk::TvlRisk(0.0) == 0.9);
}

TEST_CASE("Age risk falls with pool age and is maximal when unknown", "[risk]") {
  REQUIRE(Risk::AgeRisk(365.0) == 0.2);
  REQUIRE(Risk::AgeRisk(364.5) == 0.4);
  REQUIRE(Risk::AgeRisk(180.0) == 0.4);
  REQUIRE(Risk::AgeRisk(90.0) == 0.6);
  REQUIRE(Risk::AgeRisk(30.0) == 0.8);
  REQUIRE(Risk::AgeRisk(29.0) == 1.0);
  REQUIRE(Risk::AgeRisk(std::optional<double>()) == 1.0);
  REQUIRE(Risk::AgeRisk(std::optional<double>(400.0)) == 0.2);
}

TEST_CASE("Composite score stays within [0,1]", "[risk]") {
  const std::vector<double> levels = {0.0, 0.3, 1.0};
  const std::vector<RiskWeights> tables = {
    RiskWeights(),
    RiskWeights{1.0, 0.0, 0.0, 0.0, 0.0},
    RiskWeights{0.0, 0.0, 0.0, 0.0, 1.0},
    RiskWeights{0.1, 0.1, 0.1, 0.1, 0.6},
  };
  for (const auto& w : tables) {
    REQUIRE(w.Sum() == Approx(1.0));
    for (double a : levels) for (double b : levels) for (double c : levels) for (double d : levels) for (double e : levels) {
      const double s = RiskScorer::Score(RiskFactors{a, b, c, d, e}, w);
      REQUIRE(s >= 0.0);
      REQUIRE(s <= 1.0);
    }
  }
}

TEST_CASE("Composite score inverts protocol reputation", "[risk]") {
  RiskScorer scorer;
  REQUIRE(scorer.Score(RiskFactors{0.0, 0.0, 0.0, 0.0, 1.0}) == 0.0);
  REQUIRE(scorer.Score(RiskFactors{1.0, 1.0, 1.0, 1.0, 0.0}) == Approx(1.0));
  // 0.5*0.25 + 0.2*0.2 + 0.4*0.15 + 0 + (1-0.8)*0.2
  REQUIRE(scorer.Score(RiskFactors{0.5, 0.2, 0.4, 0.0, 0.8}) == Approx(0.265));
}

TEST_CASE("Volatility risk annualizes daily return dispersion", "[risk]") {
  REQUIRE(Risk::VolatilityRisk({}) == 0.0);
  REQUIRE(Risk::VolatilityRisk({5.0}) == 0.0);
  REQUIRE(Risk::VolatilityRisk({2.0, 2.0, 2.0, 2.0}) == 0.0);
  REQUIRE(Risk::VolatilityRisk({100.0, 100.1, 100.0}) == Approx(0.0191).margin(1e-4));
  REQUIRE(Risk::VolatilityRisk({100.0, 110.0, 100.0, 110.0, 100.0}) == 1.0);
  // A zero price cannot seed a return.
  REQUIRE(Risk::VolatilityRisk({0.0, 1.0}) == 0.0);
}

TEST_CASE("Max drawdown is the deepest fall from a running peak", "[risk]") {
  REQUIRE(Risk::MaxDrawdown({1.0, 2.0, 1.0, 3.0}) == Approx(0.5));
  REQUIRE(Risk::MaxDrawdown({1.0, 2.0, 3.0}) == 0.0);
  REQUIRE(Risk::MaxDrawdown({}) == 0.0);
}

TEST_CASE("Impermanent loss risk follows the price ratio", "[risk]") {
  REQUIRE(Risk::ImpermanentLossRisk({1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}) == 0.0);
  REQUIRE(Risk::ImpermanentLossRisk({1.0, 1.0, 1.0, 1.0}, {1.0, 1.0, 0.5, 0.5}) == Approx(0.325));
  REQUIRE(Risk::ImpermanentLossRisk({1.0}, {1.0}) == 0.0);
}

TEST_CASE("Impermanent loss aligns series of different lengths on their tails", "[risk]") {
  REQUIRE(Risk::ImpermanentLossRisk({5.0, 1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}) == 0.0);
  REQUIRE(Risk::ImpermanentLossRisk({1.0, 1.0}, {9.0, 1.0, 1.0}) == 0.0);
}

TEST_CASE("Protocol reputation blends base score with health signals", "[risk]") {
  REQUIRE(Risk::ProtocolReputation(0.9, 0.25, 50000.0, 73.0) == Approx(0.72));
  REQUIRE(Risk::ProtocolReputation(0.9, 0.25, 50000.0, std::nullopt) == Approx(0.56));
  REQUIRE(Risk::ProtocolReputation(1.0, 5.0, 1e9, 0.0) == Approx(1.0));
  REQUIRE(Risk::ProtocolReputation(0.0, -2.0, 0.0, 1000.0) == 0.0);
}

TEST_CASE("Base scores default per protocol", "[risk]") {
  RiskScorer scorer;
  REQUIRE(scorer.BaseScore("pancakeswap") == 0.9);
  REQUIRE(scorer.BaseScore("venus") == 0.85);
  REQUIRE(scorer.BaseScore("alpaca") == 0.8);
  REQUIRE(scorer.BaseScore("biswap") == 0.75);
  REQUIRE(scorer.BaseScore("unknown-dex") == 0.5);
}

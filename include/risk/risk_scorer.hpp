#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Each factor is in [0,1]. Higher means riskier, except protocol_reputation where higher is safer.
struct RiskFactors {
  double tvl_risk = 0.0;
  double volatility_risk = 0.0;
  double age_risk = 0.0;
  double il_risk = 0.0;
  double protocol_reputation = 0.0;
};

struct RiskWeights {
  double tvl = 0.25;
  double volatility = 0.20;
  double age = 0.15;
  double il = 0.20;
  double protocol = 0.20;

  double Sum() const { return tvl + volatility + age + il + protocol; }
};

// (threshold, value) sorted by threshold descending.
using StepTable = std::vector<std::pair<double, double>>;

namespace Risk {
  // Value of the first row whose threshold is <= x, else `floor_value`.
  double StepRisk(const StepTable& table, double x, double floor_value);

  double TvlRisk(double tvl_usd);
  double AgeRisk(double age_days);
  // Unknown age scores as the youngest pool.
  double AgeRisk(const std::optional<double>& age_days);

  // Population standard deviation.
  double StdDev(const std::vector<double>& values);
  double MaxDrawdown(const std::vector<double>& series);

  // Annualized volatility of daily simple returns, clamped to [0,1].
  double VolatilityRisk(const std::vector<double>& prices);

  // 0.7 * min(1, std(p1/p0)) + 0.3 * min(1, maxDrawdown(p1/p0)). Series of unequal
  // length are aligned on their most recent common tail.
  double ImpermanentLossRisk(const std::vector<double>& token0_prices, const std::vector<double>& token1_prices);

  // 0.4 * base + 0.2 * growth + 0.2 * users + 0.2 * audit freshness; each term clamped to [0,1].
  double ProtocolReputation(double base_score,
                            double tvl_growth,
                            double user_count,
                            const std::optional<double>& days_since_audit);

  double Clamp01(double v);
}

class RiskScorer {
public:
  static constexpr double kUnknownProtocolBase = 0.5;

  RiskScorer();
  RiskScorer(RiskWeights weights, std::unordered_map<std::string, double> base_scores);

  // Weighted sum with the protocol term taken as (1 - reputation), clamped to [0,1].
  static double Score(const RiskFactors& factors, const RiskWeights& weights);
  double Score(const RiskFactors& factors) const { return Score(factors, weights_); }

  double BaseScore(const std::string& protocol_id) const;
  const RiskWeights& Weights() const { return weights_; }

  static std::unordered_map<std::string, double> DefaultBaseScores();

private:
  RiskWeights weights_;
  std::unordered_map<std::string, double> base_scores_;
};

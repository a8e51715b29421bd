#include "risk/risk_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace Risk {
  double Clamp01(double v) {
    if (!std::isfinite(v)) return v > 0 ? 1.0 : 0.0;
    return std::min(1.0, std::max(0.0, v));
  }

  double StepRisk(const StepTable& table, double x, double floor_value) {
    for (const auto& row : table) {
      if (x >= row.first) return row.second;
    }
    return floor_value;
  }

  double TvlRisk(double tvl_usd) {
    static const StepTable table = {
      {10000000.0, 0.1},
      {5000000.0, 0.3},
      {1000000.0, 0.5},
      {500000.0, 0.7},
    };
    return StepRisk(table, tvl_usd, 0.9);
  }

  double AgeRisk(double age_days) {
    static const StepTable table = {
      {365.0, 0.2},
      {180.0, 0.4},
      {90.0, 0.6},
      {30.0, 0.8},
    };
    return StepRisk(table, age_days, 1.0);
  }

  double AgeRisk(const std::optional<double>& age_days) {
    return age_days ? AgeRisk(*age_days) : 1.0;
  }

  double StdDev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    long double mean = 0.0L;
    for (double v : values) mean += v;
    mean /= static_cast<long double>(values.size());
    long double var = 0.0L;
    for (double v : values) var += (v - mean) * (v - mean);
    var /= static_cast<long double>(values.size());
    return static_cast<double>(std::sqrt(var));
  }

  double MaxDrawdown(const std::vector<double>& series) {
    double peak = 0.0;
    double worst = 0.0;
    for (double v : series) {
      if (v > peak) peak = v;
      if (peak <= 0.0) continue;
      worst = std::max(worst, (peak - v) / peak);
    }
    return worst;
  }

  double VolatilityRisk(const std::vector<double>& prices) {
    if (prices.size() < 2) return 0.0;
    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
      if (prices[i - 1] <= 0.0) continue;
      returns.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
    }
    if (returns.empty()) return 0.0;
    return Clamp01(StdDev(returns) * std::sqrt(365.0));
  }

  double ImpermanentLossRisk(const std::vector<double>& token0_prices, const std::vector<double>& token1_prices) {
    const size_t n = std::min(token0_prices.size(), token1_prices.size());
    const size_t off0 = token0_prices.size() - n;
    const size_t off1 = token1_prices.size() - n;
    std::vector<double> ratios;
    ratios.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      const double p0 = token0_prices[off0 + i];
      if (p0 <= 0.0) continue;
      ratios.push_back(token1_prices[off1 + i] / p0);
    }
    if (ratios.size() < 2) return 0.0;
    const double vol = std::min(1.0, StdDev(ratios));
    const double dd = std::min(1.0, MaxDrawdown(ratios));
    return Clamp01(0.7 * vol + 0.3 * dd);
  }

  double ProtocolReputation(double base_score,
                            double tvl_growth,
                            double user_count,
                            const std::optional<double>& days_since_audit) {
    const double growth = Clamp01((tvl_growth + 0.5) / 1.5);
    const double users = Clamp01(user_count / 100000.0);
    const double audit = days_since_audit ? Clamp01(1.0 - *days_since_audit / 365.0) : 0.0;
    return Clamp01(0.4 * Clamp01(base_score) + 0.2 * growth + 0.2 * users + 0.2 * audit);
  }
}

RiskScorer::RiskScorer() : base_scores_(DefaultBaseScores()) {}

RiskScorer::RiskScorer(RiskWeights weights, std::unordered_map<std::string, double> base_scores)
  : weights_(weights), base_scores_(std::move(base_scores)) {}

std::unordered_map<std::string, double> RiskScorer::DefaultBaseScores() {
  return {
    {"pancakeswap", 0.9},
    {"venus", 0.85},
    {"alpaca", 0.8},
    {"biswap", 0.75},
  };
}

double RiskScorer::Score(const RiskFactors& f, const RiskWeights& w) {
  const double composite =
    Risk::Clamp01(f.tvl_risk) * w.tvl +
    Risk::Clamp01(f.volatility_risk) * w.volatility +
    Risk::Clamp01(f.age_risk) * w.age +
    Risk::Clamp01(f.il_risk) * w.il +
    (1.0 - Risk::Clamp01(f.protocol_reputation)) * w.protocol;
  return Risk::Clamp01(composite);
}

double RiskScorer::BaseScore(const std::string& protocol_id) const {
  auto it = base_scores_.find(protocol_id);
  return it != base_scores_.end() ? it->second : kUnknownProtocolBase;
}

#pragma once
#include "scanner/opportunity.hpp"
#include "yield/yield_calculator.hpp"

struct EvaluationSettings {
  double blocks_per_year = Yield::kDefaultBlocksPerYear;
  double max_lending_rate = Yield::kDefaultMaxLendingRate;
};

// Turns an assembled pool detail into a scored Opportunity. Stateless and safe to copy into tasks.
class OpportunityEvaluator {
public:
  OpportunityEvaluator(RiskScorer scorer, EvaluationSettings settings)
    : scorer_(std::move(scorer)), settings_(settings) {}

  Opportunity Evaluate(const PoolDetail& detail, double protocol_reputation, long long timestamp) const;

  static double ExpectedRoi(double rate_percent, double risk_score);

private:
  RiskScorer scorer_;
  EvaluationSettings settings_;
};

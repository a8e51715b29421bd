#pragma once
#include "protocols/protocol_adapter.hpp"
#include "risk/risk_scorer.hpp"
#include <map>
#include <string>

enum class RateKind { Apr, Apy };

inline const char* RateKindName(RateKind kind) { return kind == RateKind::Apy ? "APY" : "APR"; }

struct Opportunity {
  std::string protocol;
  OpportunityType type = OpportunityType::Farm;
  std::string address;
  std::string label;
  double tvl_usd = 0.0;
  double rate = 0.0;         // percent
  RateKind rate_kind = RateKind::Apr;
  double base_rate = 0.0;    // percent, lending side
  double reward_rate = 0.0;  // percent, emissions
  double risk_score = 0.0;
  RiskFactors factors;
  double expected_roi = 0.0; // fraction: rate / 100 * (1 - risk_score)
  long long timestamp = 0;
  std::map<std::string, double> extras;
};

#pragma once
#include "scanner/opportunity_evaluator.hpp"
#include "scheduler/thread_pool.hpp"
#include "data/metrics_provider.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class ContractReader;
class TokenCache;

struct RankFilter {
  double min_expected_roi = 0.15;
  double max_risk_score = 0.65;
  double min_tvl_usd = 500000.0;
};

struct ScanSettings {
  size_t max_concurrency = 4;
  std::chrono::milliseconds timeout = std::chrono::seconds(120);
  RankFilter filter;
  EvaluationSettings evaluation;
  // Days since each protocol's last audit; protocols missing here score 0 on audit freshness.
  std::unordered_map<std::string, double> audit_age_days;
};

struct PoolFailure {
  std::string protocol;
  std::string pool;
  ScanError error;
};

struct AdapterFailure {
  std::string protocol;
  std::string message;
};

struct ScanReport {
  std::vector<Opportunity> opportunities;  // ranked and filtered
  std::vector<PoolFailure> failures;
  std::vector<AdapterFailure> adapter_failures;
  unsigned long long block = 0;
  size_t pools_total = 0;
  size_t evaluated = 0;  // successes before filtering
  bool cancelled = false;
  double elapsed_s = 0.0;
};

// Filters by the thresholds, then sorts by expected ROI descending with ties broken by
// risk ascending, address ascending, protocol ascending.
std::vector<Opportunity> RankOpportunities(std::vector<Opportunity> list, const RankFilter& filter);

// Runs one scan across adapters on a bounded worker pool. Adapters and providers must
// outlive the orchestrator: abandoned tasks of a cancelled scan may still be running.
class ScanOrchestrator {
public:
  ScanOrchestrator(ContractReader& reader,
                   TokenCache& tokens,
                   ProtocolMetricsProvider* metrics,
                   RiskScorer scorer,
                   ScanSettings settings);

  // Throws ScanException{ConfigInvalid} when the node cannot be reached.
  ScanReport Scan(const std::vector<ProtocolAdapter*>& adapters);
  // Cancels the scan in progress, if any.
  void Cancel();

private:
  struct ScanState;

  double ProtocolReputation(const std::string& protocol_id);

  ContractReader& reader_;
  TokenCache& tokens_;
  ProtocolMetricsProvider* metrics_;
  RiskScorer scorer_;
  ScanSettings settings_;
  std::shared_ptr<const OpportunityEvaluator> evaluator_;
  std::mutex active_mutex_;
  std::shared_ptr<ScanState> active_;
  ThreadPool pool_;
};

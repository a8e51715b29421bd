#include "scanner/scan_orchestrator.hpp"
#include "node_connection/contract_reader.hpp"
#include "cache/token_cache.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <ctime>

struct ScanOrchestrator::ScanState {
  std::mutex mutex;
  std::condition_variable cv;
  size_t remaining = 0;
  bool cancel_requested = false;
  std::atomic<bool> abandoned{false};
  std::vector<Opportunity> opportunities;
  std::vector<PoolFailure> failures;
};

std::vector<Opportunity> RankOpportunities(std::vector<Opportunity> list, const RankFilter& filter) {
  list.erase(std::remove_if(list.begin(), list.end(), [&](const Opportunity& o) {
               return o.expected_roi < filter.min_expected_roi ||
                      o.risk_score > filter.max_risk_score ||
                      o.tvl_usd < filter.min_tvl_usd;
             }),
             list.end());
  std::sort(list.begin(), list.end(), [](const Opportunity& a, const Opportunity& b) {
    if (a.expected_roi != b.expected_roi) return a.expected_roi > b.expected_roi;
    if (a.risk_score != b.risk_score) return a.risk_score < b.risk_score;
    if (a.address != b.address) return a.address < b.address;
    return a.protocol < b.protocol;
  });
  return list;
}

ScanOrchestrator::ScanOrchestrator(ContractReader& reader,
                                   TokenCache& tokens,
                                   ProtocolMetricsProvider* metrics,
                                   RiskScorer scorer,
                                   ScanSettings settings)
  : reader_(reader),
    tokens_(tokens),
    metrics_(metrics),
    scorer_(scorer),
    settings_(std::move(settings)),
    evaluator_(std::make_shared<const OpportunityEvaluator>(std::move(scorer), settings_.evaluation)),
    pool_(settings_.max_concurrency) {}

void ScanOrchestrator::Cancel() {
  std::lock_guard<std::mutex> guard(active_mutex_);
  if (!active_) return;
  {
    std::lock_guard<std::mutex> lock(active_->mutex);
    active_->cancel_requested = true;
  }
  active_->cv.notify_all();
}

double ScanOrchestrator::ProtocolReputation(const std::string& protocol_id) {
  ProtocolMetrics m;
  if (metrics_) {
    try {
      m = metrics_->Get(protocol_id);
    } catch (const std::exception& e) {
      Logger::Warning("metrics unavailable for " + protocol_id + ", using neutral values: " + e.what(), __FILE__, __LINE__);
      m = ProtocolMetrics();
    }
  }
  std::optional<double> audit;
  auto it = settings_.audit_age_days.find(protocol_id);
  if (it != settings_.audit_age_days.end()) audit = it->second;
  const double rep = Risk::ProtocolReputation(scorer_.BaseScore(protocol_id), m.tvl_growth, m.user_count, audit);
  Logger::Info(protocol_id + " reputation " + std::to_string(rep) + " (tvl change 24h " +
               std::to_string(m.tvl_change_24h) + "%)", __FILE__, __LINE__);
  return rep;
}

ScanReport ScanOrchestrator::Scan(const std::vector<ProtocolAdapter*>& adapters) {
  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + settings_.timeout;
  const long long timestamp = static_cast<long long>(std::time(nullptr));
  auto& events = StructuredLogger::Instance();
  ScanReport report;

  try {
    report.block = reader_.BlockNumber();
  } catch (const std::exception& e) {
    Logger::Critical(std::string("connectivity check failed: ") + e.what(), __FILE__, __LINE__);
    throw ScanException(ErrorKind::ConfigInvalid, "rpc", std::string("connectivity check failed: ") + e.what());
  }

  auto state = std::make_shared<ScanState>();
  {
    std::lock_guard<std::mutex> guard(active_mutex_);
    active_ = state;
  }
  events.LogEvent("scan_started", {{"block", report.block}, {"adapters", adapters.size()}});
  Logger::Info("scan started at block " + std::to_string(report.block) + " with " +
               std::to_string(adapters.size()) + " adapters", __FILE__, __LINE__);

  tokens_.Clear();

  bool cancelled = false;
  auto is_cancelled = [&]() {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->cancel_requested || std::chrono::steady_clock::now() >= deadline) cancelled = true;
    return cancelled;
  };

  struct Job {
    ProtocolAdapter* adapter;
    PoolRef ref;
    double reputation;
  };
  std::vector<Job> jobs;
  for (auto* adapter : adapters) {
    if (is_cancelled()) break;
    const std::string id = adapter->ProtocolId();
    std::vector<PoolRef> refs;
    try {
      refs = adapter->EnumeratePools();
    } catch (const std::exception& e) {
      Logger::Error("adapter " + id + " failed to enumerate: " + e.what(), __FILE__, __LINE__);
      report.adapter_failures.push_back({id, e.what()});
      events.LogEvent("adapter_failed", {{"protocol", id}, {"error", e.what()}});
      continue;
    }
    if (refs.empty()) continue;
    const double reputation = ProtocolReputation(id);
    for (auto& r : refs) jobs.push_back(Job{adapter, std::move(r), reputation});
  }
  report.pools_total = jobs.size();

  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->remaining = jobs.size();
  }
  auto evaluator = evaluator_;
  size_t enqueued = 0;
  for (const auto& job : jobs) {
    if (is_cancelled()) break;
    pool_.Enqueue([state, evaluator, job, timestamp]() {
      if (state->abandoned.load()) return;
      std::optional<Opportunity> opportunity;
      std::optional<ScanError> error;
      try {
        auto detail = job.adapter->FetchPoolDetail(job.ref);
        if (detail) {
          opportunity = evaluator->Evaluate(detail.Value(), job.reputation, timestamp);
        } else {
          error = detail.Error();
        }
      } catch (const std::exception& e) {
        error = ScanError{ErrorKind::FetchFailed, job.ref.Describe(), e.what()};
      }
      if (error) {
        Logger::Warning("pool " + job.ref.Describe() + " skipped: " + error->Describe(), __FILE__, __LINE__);
      }
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (opportunity) state->opportunities.push_back(std::move(*opportunity));
        if (error) state->failures.push_back(PoolFailure{job.ref.protocol, job.ref.Describe(), *error});
        --state->remaining;
      }
      state->cv.notify_all();
    });
    ++enqueued;
  }

  {
    std::unique_lock<std::mutex> lock(state->mutex);
    // Jobs never enqueued will not report back.
    state->remaining -= jobs.size() - enqueued;
    while (!cancelled && state->remaining > 0) {
      if (state->cancel_requested) break;
      if (state->cv.wait_until(lock, deadline) == std::cv_status::timeout && state->remaining > 0) {
        cancelled = true;
      }
    }
    if (state->cancel_requested) cancelled = true;
    if (cancelled) {
      state->abandoned = true;
    } else {
      report.failures = std::move(state->failures);
      report.evaluated = state->opportunities.size();
      report.opportunities = RankOpportunities(std::move(state->opportunities), settings_.filter);
    }
  }
  {
    std::lock_guard<std::mutex> guard(active_mutex_);
    if (active_ == state) active_.reset();
  }

  report.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  if (cancelled) {
    report.cancelled = true;
    report.opportunities.clear();
    Logger::Warning("scan cancelled after " + std::to_string(report.elapsed_s) + "s", __FILE__, __LINE__);
    events.LogEvent("scan_cancelled", {{"elapsed_s", report.elapsed_s}, {"pools", report.pools_total}});
    return report;
  }

  for (const auto& f : report.failures) {
    events.LogEvent("pool_failed", {{"protocol", f.protocol}, {"pool", f.pool},
                                    {"kind", ErrorKindName(f.error.kind)}, {"error", f.error.message}});
  }
  Logger::Info("scan completed: " + std::to_string(report.evaluated) + " evaluated, " +
               std::to_string(report.opportunities.size()) + " ranked, " +
               std::to_string(report.failures.size()) + " pool failures, " +
               std::to_string(report.adapter_failures.size()) + " adapter failures", __FILE__, __LINE__);
  events.LogEvent("scan_completed", {{"block", report.block},
                                     {"pools", report.pools_total},
                                     {"evaluated", report.evaluated},
                                     {"ranked", report.opportunities.size()},
                                     {"pool_failures", report.failures.size()},
                                     {"adapter_failures", report.adapter_failures.size()},
                                     {"elapsed_s", report.elapsed_s}});
  return report;
}

#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/scan_config.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "node_connection/contract_reader.hpp"
#include "cache/token_cache.hpp"
#include "cache/price_cache.hpp"
#include "oracle/pair_source.hpp"
#include "oracle/price_oracle.hpp"
#include "data/history_provider.hpp"
#include "data/metrics_provider.hpp"
#include "protocols/amm_farm_adapter.hpp"
#include "protocols/lending_market_adapter.hpp"
#include "protocols/yield_vault_adapter.hpp"
#include "scanner/scan_orchestrator.hpp"
#include "report/opportunity_report.hpp"
#include "telemetry/structured_logger.hpp"
#include "constants/bsc.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <unordered_map>
#include <vector>

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void OnSignal(int) { g_interrupted = 1; }

// Signal handlers may only set a flag; this thread turns it into a scan cancellation.
class InterruptWatcher {
public:
  explicit InterruptWatcher(ScanOrchestrator& orchestrator)
    : thread_([this, &orchestrator]{
        while (!done_.load()) {
          if (g_interrupted) {
            Logger::Warning("interrupt received, cancelling scan");
            orchestrator.Cancel();
            return;
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
      }) {}
  ~InterruptWatcher() {
    done_ = true;
    if (thread_.joinable()) thread_.join();
  }
  InterruptWatcher(const InterruptWatcher&) = delete;
  InterruptWatcher& operator=(const InterruptWatcher&) = delete;
private:
  std::atomic<bool> done_{false};
  std::thread thread_;
};
}

// Usage: yield_radar [path/to/.env]
int main(int argc, char** argv) {
  const std::string env_path = argc > 1 ? argv[1] : ".env";
  try {
    ConfigManager::Initialize(env_path);
    ScanConfig cfg = LoadScanConfig();

    Logger::Initialize(cfg.log_file, cfg.log_level, cfg.log_console);
    if (!cfg.events_file.empty()) StructuredLogger::Instance().Initialize(cfg.events_file);
    Logger::Info("yield radar starting; protocols enabled: " + std::to_string(cfg.enabled_protocols.size()));

    std::unique_ptr<HttpClient> http(CreateCurlHttpClient());
    RpcClient rpc(*http, cfg.rpc_url, cfg.auth_header, cfg.rpc_timeout_ms);
    RpcContractReader reader(rpc, cfg.rpc_timeout_ms);

    TokenCache tokens(reader);
    PriceCache prices(std::chrono::seconds(cfg.price_cache_ttl_s));
    FactoryPairSource pairs(reader, tokens, cfg.factory);
    PriceOracleSettings oracle_settings;
    oracle_settings.intermediates = cfg.intermediates;
    oracle_settings.max_hops = cfg.max_price_hops;
    oracle_settings.overrides = cfg.price_overrides;
    oracle_settings.override_reference = cfg.reference_token;
    PriceOracle oracle(pairs, prices, oracle_settings);

    std::unique_ptr<SubgraphHistoryProvider> history;
    if (!cfg.subgraph_url.empty()) history = std::make_unique<SubgraphHistoryProvider>(*http, cfg.subgraph_url);
    std::unique_ptr<SubgraphHistoryProvider> biswap_history;
    if (!cfg.biswap_subgraph_url.empty()) {
      biswap_history = std::make_unique<SubgraphHistoryProvider>(*http, cfg.biswap_subgraph_url);
    }
    std::unique_ptr<DefiLlamaMetricsProvider> metrics;
    if (!cfg.defillama_url.empty()) {
      metrics = std::make_unique<DefiLlamaMetricsProvider>(
        *http, cfg.defillama_url, cfg.history_days, cfg.subgraph_url,
        std::unordered_map<std::string, std::string>{{"pancakeswap", BscConstants::PANCAKESWAP_FACTORY}});
    }

    AdapterContext ctx{reader, tokens, oracle, history.get(), cfg.reference_token, cfg.history_days};
    std::vector<std::unique_ptr<ProtocolAdapter>> owned;
    for (const auto& id : cfg.enabled_protocols) {
      if (id == "pancakeswap") owned.push_back(std::make_unique<AmmFarmAdapter>(ctx, cfg.pancakeswap));
      else if (id == "biswap") owned.push_back(std::make_unique<AmmFarmAdapter>(ctx, cfg.biswap, biswap_history.get()));
      else if (id == "venus") owned.push_back(std::make_unique<LendingMarketAdapter>(ctx, cfg.venus));
      else if (id == "alpaca") owned.push_back(std::make_unique<YieldVaultAdapter>(ctx, cfg.alpaca));
    }
    std::vector<ProtocolAdapter*> adapters;
    for (auto& a : owned) adapters.push_back(a.get());

    ScanOrchestrator orchestrator(reader, tokens, metrics.get(), RiskScorer(cfg.weights, cfg.base_scores), cfg.scan);
    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);
    ScanReport report;
    {
      InterruptWatcher watcher(orchestrator);
      report = orchestrator.Scan(adapters);
    }

    OpportunityReport::PrintSummary(std::cout, report);
    if (!report.cancelled) {
      if (!cfg.output_json.empty()) OpportunityReport::WriteJson(cfg.output_json, report.opportunities);
      if (!cfg.output_csv.empty()) OpportunityReport::WriteCsv(cfg.output_csv, report.opportunities);
      Logger::Info("wrote " + std::to_string(report.opportunities.size()) + " opportunities");
    }

    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return report.cancelled ? 2 : 0;
  } catch (const ScanException& e) {
    std::cerr << "fatal: " << e.what() << std::endl;
    Logger::Critical(std::string("fatal: ") + e.what());
  } catch (const std::exception& e) {
    std::cerr << "unhandled error: " << e.what() << std::endl;
    Logger::Critical(std::string("unhandled error: ") + e.what());
  }
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
  return 1;
}

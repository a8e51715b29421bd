#pragma once
#include "common/logger.hpp"
#include "protocols/amm_farm_adapter.hpp"
#include "protocols/lending_market_adapter.hpp"
#include "protocols/yield_vault_adapter.hpp"
#include "scanner/scan_orchestrator.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct ScanConfig {
  // Node and data services
  std::string rpc_url;
  std::optional<std::string> auth_header;
  int rpc_timeout_ms = 5000;
  std::string subgraph_url;   // token prices and PancakeSwap pairs; empty disables history and pool age
  std::string biswap_subgraph_url;  // Biswap's own exchange subgraph; empty leaves Biswap pair age unknown
  std::string defillama_url;  // empty disables protocol metrics

  // Pricing
  std::string factory;
  std::string reference_token;
  std::vector<std::string> intermediates;
  int max_price_hops = 2;
  int price_cache_ttl_s = 300;
  std::unordered_map<std::string, double> price_overrides;
  int history_days = 30;

  // Scoring and the scan itself
  ScanSettings scan;
  RiskWeights weights;
  std::unordered_map<std::string, double> base_scores;

  // Protocols
  std::vector<std::string> enabled_protocols;
  AmmFarmConfig pancakeswap;
  AmmFarmConfig biswap;
  LendingMarketConfig venus;
  YieldVaultConfig alpaca;

  // Output
  std::string output_json;
  std::string output_csv;
  std::string log_file;
  std::string events_file;
  LogLevel log_level = LogLevel::INFO;
  bool log_console = true;

  bool ProtocolEnabled(const std::string& id) const;
};

inline const std::vector<std::string>& KnownProtocols() {
  static const std::vector<std::string> ids = {"pancakeswap", "venus", "alpaca", "biswap"};
  return ids;
}

// Reads ConfigManager keys. Throws ScanException{ConfigInvalid} naming the offending key.
ScanConfig LoadScanConfig();

#include "config/scan_config.hpp"
#include "common/config_manager.hpp"
#include "constants/bsc.hpp"
#include "oracle/price_oracle.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace {
std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

// 40 hex digits with an optional 0x prefix; returns the lower-case 0x form.
std::string CheckedAddress(const std::string& key, const std::string& v) {
  const std::string hex = Strip0x(v);
  if (hex.size() != 40 || !std::all_of(hex.begin(), hex.end(), [](char c){ return HexDigitValue(c) >= 0; })) {
    throw ScanException(ErrorKind::ConfigInvalid, key, "not a 20-byte hex address: " + v);
  }
  return NormalizeAddress(v);
}

std::string Address(const std::string& key, const std::string& fallback) {
  return CheckedAddress(key, ConfigManager::Get(key).value_or(fallback));
}

double NonNegative(const std::string& key, double fallback) {
  const double v = ConfigManager::GetDoubleOr(key, fallback);
  if (v < 0.0) throw ScanException(ErrorKind::ConfigInvalid, key, "must not be negative");
  return v;
}
}

bool ScanConfig::ProtocolEnabled(const std::string& id) const {
  return std::find(enabled_protocols.begin(), enabled_protocols.end(), id) != enabled_protocols.end();
}

ScanConfig LoadScanConfig() {
  ScanConfig cfg;
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) cfg.auth_header = *a;
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 5000);
  if (cfg.rpc_timeout_ms < 1) throw ScanException(ErrorKind::ConfigInvalid, "RPC_TIMEOUT_MS", "must be at least 1");
  cfg.subgraph_url = ConfigManager::Get("SUBGRAPH_URL").value_or(BscConstants::PANCAKESWAP_SUBGRAPH);
  cfg.biswap_subgraph_url = ConfigManager::Get("BISWAP_SUBGRAPH_URL").value_or("");
  cfg.defillama_url = ConfigManager::Get("DEFILLAMA_URL").value_or(BscConstants::DEFILLAMA_API);

  cfg.factory = Address("PANCAKESWAP_FACTORY", BscConstants::PANCAKESWAP_FACTORY);
  cfg.reference_token = Address("REFERENCE_TOKEN", BscConstants::BUSD);
  auto intermediates = ConfigManager::GetCsv("INTERMEDIATE_TOKENS");
  if (!ConfigManager::Get("INTERMEDIATE_TOKENS")) intermediates = {BscConstants::WBNB, BscConstants::USDT};
  for (const auto& t : intermediates) cfg.intermediates.push_back(CheckedAddress("INTERMEDIATE_TOKENS", t));
  cfg.max_price_hops = ConfigManager::GetIntOr("MAX_PRICE_HOPS", 2);
  if (cfg.max_price_hops < 1) throw ScanException(ErrorKind::ConfigInvalid, "MAX_PRICE_HOPS", "must be at least 1");
  cfg.price_cache_ttl_s = ConfigManager::GetIntOr("PRICE_CACHE_TTL_S", 300);
  if (cfg.price_cache_ttl_s < 0) throw ScanException(ErrorKind::ConfigInvalid, "PRICE_CACHE_TTL_S", "must not be negative");
  if (auto o = ConfigManager::Get("PRICE_OVERRIDES")) cfg.price_overrides = PriceOracle::ParseOverrides(*o);
  cfg.history_days = ConfigManager::GetIntOr("HISTORY_DAYS", 30);
  if (cfg.history_days < 1) throw ScanException(ErrorKind::ConfigInvalid, "HISTORY_DAYS", "must be at least 1");

  const int concurrency = ConfigManager::GetIntOr("MAX_CONCURRENCY", 4);
  if (concurrency < 1) throw ScanException(ErrorKind::ConfigInvalid, "MAX_CONCURRENCY", "must be at least 1");
  cfg.scan.max_concurrency = static_cast<size_t>(concurrency);
  const int timeout_s = ConfigManager::GetIntOr("SCAN_TIMEOUT_S", 120);
  if (timeout_s < 1) throw ScanException(ErrorKind::ConfigInvalid, "SCAN_TIMEOUT_S", "must be at least 1");
  cfg.scan.timeout = std::chrono::seconds(timeout_s);
  cfg.scan.filter.min_expected_roi = ConfigManager::GetDoubleOr("MIN_EXPECTED_ROI", 0.15);
  cfg.scan.filter.max_risk_score = ConfigManager::GetDoubleOr("MAX_RISK_SCORE", 0.65);
  cfg.scan.filter.min_tvl_usd = NonNegative("MIN_TVL_USD", 500000.0);
  cfg.scan.evaluation.blocks_per_year = ConfigManager::GetDoubleOr("BLOCKS_PER_YEAR", BscConstants::BLOCKS_PER_YEAR);
  if (cfg.scan.evaluation.blocks_per_year <= 0.0) {
    throw ScanException(ErrorKind::ConfigInvalid, "BLOCKS_PER_YEAR", "must be positive");
  }
  cfg.scan.evaluation.max_lending_rate = NonNegative("MAX_LENDING_RATE", 0.15);

  cfg.weights.tvl = NonNegative("RISK_WEIGHT_TVL", cfg.weights.tvl);
  cfg.weights.volatility = NonNegative("RISK_WEIGHT_VOLATILITY", cfg.weights.volatility);
  cfg.weights.age = NonNegative("RISK_WEIGHT_AGE", cfg.weights.age);
  cfg.weights.il = NonNegative("RISK_WEIGHT_IL", cfg.weights.il);
  cfg.weights.protocol = NonNegative("RISK_WEIGHT_PROTOCOL", cfg.weights.protocol);
  if (cfg.weights.Sum() <= 0.0) throw ScanException(ErrorKind::ConfigInvalid, "RISK_WEIGHT_*", "weights must sum above 0");
  if (std::abs(cfg.weights.Sum() - 1.0) > 1e-6) {
    Logger::Warning("risk weights sum to " + std::to_string(cfg.weights.Sum()) + ", composite is clamped to [0,1]",
                    __FILE__, __LINE__);
  }

  cfg.base_scores = RiskScorer::DefaultBaseScores();
  for (const auto& id : KnownProtocols()) {
    const std::string suffix = Upper(id);
    if (ConfigManager::Get("PROTOCOL_BASE_" + suffix)) {
      const double base = NonNegative("PROTOCOL_BASE_" + suffix, 0.5);
      if (base > 1.0) throw ScanException(ErrorKind::ConfigInvalid, "PROTOCOL_BASE_" + suffix, "must be within [0,1]");
      cfg.base_scores[id] = base;
    }
    if (ConfigManager::Get("AUDIT_AGE_DAYS_" + suffix)) {
      cfg.scan.audit_age_days[id] = NonNegative("AUDIT_AGE_DAYS_" + suffix, 0.0);
    }
  }

  if (ConfigManager::Get("ENABLED_PROTOCOLS")) {
    for (const auto& raw : ConfigManager::GetCsv("ENABLED_PROTOCOLS")) {
      const std::string id = Lower(raw);
      if (std::find(KnownProtocols().begin(), KnownProtocols().end(), id) == KnownProtocols().end()) {
        throw ScanException(ErrorKind::ConfigInvalid, "ENABLED_PROTOCOLS", "unknown protocol " + raw);
      }
      if (!cfg.ProtocolEnabled(id)) cfg.enabled_protocols.push_back(id);
    }
  } else {
    cfg.enabled_protocols = KnownProtocols();
  }

  cfg.pancakeswap = AmmFarmConfig{"pancakeswap", Address("PANCAKESWAP_MASTERCHEF", BscConstants::PANCAKESWAP_MASTERCHEF),
                                  "cakePerBlock()", Address("CAKE_TOKEN", BscConstants::CAKE)};
  cfg.biswap = AmmFarmConfig{"biswap", Address("BISWAP_MASTERCHEF", BscConstants::BISWAP_MASTERCHEF),
                             "BSWPerBlock()", Address("BSW_TOKEN", BscConstants::BSW)};
  cfg.venus = LendingMarketConfig{"venus", Address("VENUS_COMPTROLLER", BscConstants::VENUS_COMPTROLLER),
                                  Address("VENUS_NATIVE_MARKET", BscConstants::VENUS_VBNB),
                                  Address("WRAPPED_NATIVE", BscConstants::WBNB)};
  cfg.alpaca = YieldVaultConfig{"alpaca", Address("ALPACA_FAIRLAUNCH", BscConstants::ALPACA_FAIRLAUNCH),
                                Address("ALPACA_TOKEN", BscConstants::ALPACA), "alpacaPerBlock()"};

  cfg.output_json = ConfigManager::Get("OUTPUT_JSON").value_or("opportunities.json");
  cfg.output_csv = ConfigManager::Get("OUTPUT_CSV").value_or("opportunities.csv");
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or("yield_radar.log");
  cfg.events_file = ConfigManager::Get("EVENTS_FILE").value_or("");
  cfg.log_level = ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info"));
  cfg.log_console = ConfigManager::GetBoolOr("LOG_CONSOLE", true);
  return cfg;
}

#pragma once
#include <string>
#include <unordered_map>

class HttpClient;

struct ProtocolMetrics {
  double tvl_usd = 0.0;
  double tvl_change_24h = 0.0;  // percent
  double mcap_tvl_ratio = 0.0;
  double tvl_growth = 0.0;      // fraction over the history window
  double user_count = 0.0;
};

class ProtocolMetricsProvider {
public:
  virtual ~ProtocolMetricsProvider() = default;
  // Throws std::runtime_error when the protocol's metrics cannot be fetched.
  virtual ProtocolMetrics Get(const std::string& protocol_id) = 0;
};

// DefiLlama /protocol/{slug}. User counts come from the exchange subgraph's factory entity
// for protocols listed in `factories`; other protocols report 0 users.
class DefiLlamaMetricsProvider : public ProtocolMetricsProvider {
public:
  DefiLlamaMetricsProvider(HttpClient& http,
                           std::string base_url,
                           int history_days,
                           std::string subgraph_url = "",
                           std::unordered_map<std::string, std::string> factories = {},
                           int timeout_ms = 10000);

  ProtocolMetrics Get(const std::string& protocol_id) override;

  static std::string Slug(const std::string& protocol_id);

private:
  double FetchUserCount(const std::string& factory);

  HttpClient& http_;
  std::string base_url_;
  int history_days_;
  std::string subgraph_url_;
  std::unordered_map<std::string, std::string> factories_;
  int timeout_ms_;
};

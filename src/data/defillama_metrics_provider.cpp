#include "data/metrics_provider.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

DefiLlamaMetricsProvider::DefiLlamaMetricsProvider(HttpClient& http,
                                                   std::string base_url,
                                                   int history_days,
                                                   std::string subgraph_url,
                                                   std::unordered_map<std::string, std::string> factories,
                                                   int timeout_ms)
  : http_(http), base_url_(std::move(base_url)), history_days_(history_days),
    subgraph_url_(std::move(subgraph_url)), factories_(std::move(factories)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string DefiLlamaMetricsProvider::Slug(const std::string& protocol_id) {
  static const std::unordered_map<std::string, std::string> slugs = {
    {"pancakeswap", "pancakeswap"},
    {"venus", "venus"},
    {"alpaca", "alpaca-finance"},
    {"biswap", "biswap"},
  };
  auto it = slugs.find(protocol_id);
  return it != slugs.end() ? it->second : protocol_id;
}

ProtocolMetrics DefiLlamaMetricsProvider::Get(const std::string& protocol_id) {
  const std::string url = base_url_ + "/protocol/" + Slug(protocol_id);
  auto resp = http_.Get(url, {{"Accept", "application/json"}}, timeout_ms_);
  if (resp.status == 0) throw std::runtime_error("DefiLlama transport failure: " + resp.error);
  if (resp.status < 200 || resp.status >= 300) {
    throw std::runtime_error("DefiLlama HTTP " + std::to_string(resp.status) + " for " + protocol_id);
  }
  json j = json::parse(resp.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) throw std::runtime_error("DefiLlama returned malformed JSON");

  const auto& tvl = j.at("tvl");
  if (!tvl.is_array() || tvl.empty()) throw std::runtime_error("DefiLlama has no TVL series for " + protocol_id);

  ProtocolMetrics m;
  const auto& last = tvl.back();
  m.tvl_usd = last.at("totalLiquidityUSD").get<double>();
  if (tvl.size() >= 2) {
    const double prev = tvl[tvl.size() - 2].at("totalLiquidityUSD").get<double>();
    if (prev != 0.0) m.tvl_change_24h = (m.tvl_usd - prev) / prev * 100.0;
  }
  if (j.contains("mcap") && j["mcap"].is_number() && m.tvl_usd > 0.0) {
    m.mcap_tvl_ratio = j["mcap"].get<double>() / m.tvl_usd;
  }

  // Growth over the history window: earliest point no older than history_days_ before the last.
  const long long last_date = last.at("date").get<long long>();
  const long long window_start = last_date - static_cast<long long>(history_days_) * 86400LL;
  for (const auto& point : tvl) {
    if (point.at("date").get<long long>() < window_start) continue;
    const double start = point.at("totalLiquidityUSD").get<double>();
    if (start > 0.0) m.tvl_growth = (m.tvl_usd - start) / start;
    break;
  }

  auto f = factories_.find(protocol_id);
  if (f != factories_.end() && !subgraph_url_.empty()) {
    try {
      m.user_count = FetchUserCount(f->second);
    } catch (const std::exception& e) {
      Logger::Warning("user count unavailable for " + protocol_id + ": " + e.what(), __FILE__, __LINE__);
    }
  }

  Logger::Info("metrics " + protocol_id + ": tvl=" + std::to_string(m.tvl_usd) +
               " change24h=" + std::to_string(m.tvl_change_24h) + "% growth=" + std::to_string(m.tvl_growth),
               __FILE__, __LINE__);
  return m;
}

double DefiLlamaMetricsProvider::FetchUserCount(const std::string& factory) {
  json body;
  body["query"] = "query ($id: String!) { pancakeFactory(id: $id) { totalUsers } }";
  body["variables"] = {{"id", factory}};
  auto resp = http_.Post(subgraph_url_, body.dump(), {{"Content-Type", "application/json"}}, timeout_ms_);
  if (resp.status < 200 || resp.status >= 300) {
    throw std::runtime_error("subgraph HTTP " + std::to_string(resp.status) + (resp.error.empty() ? "" : ": " + resp.error));
  }
  json j = json::parse(resp.body, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("subgraph returned malformed JSON");
  if (j.contains("errors")) throw std::runtime_error("subgraph error: " + j["errors"].dump());
  const auto& f = j.at("data").at("pancakeFactory");
  if (f.is_null()) return 0.0;
  const auto& users = f.at("totalUsers");
  return users.is_string() ? std::stod(users.get<std::string>()) : users.get<double>();
}

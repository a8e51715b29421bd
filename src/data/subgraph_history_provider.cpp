#include "data/history_provider.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <stdexcept>

using json = nlohmann::json;

namespace {
// The subgraph encodes BigDecimal fields as strings.
double NumberField(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (v.is_string()) return std::stod(v.get<std::string>());
  return v.get<double>();
}

const char* kTokenSeriesQuery =
  "query ($id: String!, $days: Int!) {"
  " tokenDayDatas(first: $days, orderBy: date, orderDirection: desc, where: {token: $id})"
  " { date priceUSD } }";

const char* kPairSeriesQuery =
  "query ($id: String!, $days: Int!) {"
  " pairDayDatas(first: $days, orderBy: date, orderDirection: desc, where: {pairAddress: $id})"
  " { date reserveUSD } }";

const char* kTokenFirstDayQuery =
  "query ($id: String!) {"
  " tokenDayDatas(first: 1, orderBy: date, orderDirection: asc, where: {token: $id})"
  " { date } }";

const char* kPairFirstDayQuery =
  "query ($id: String!) {"
  " pairDayDatas(first: 1, orderBy: date, orderDirection: asc, where: {pairAddress: $id})"
  " { date } }";

const char* kPairActivityQuery =
  "query ($id: String!, $since: Int!) {"
  " pair(id: $id) { volumeUSD txCount }"
  " pairHourDatas(first: 24, where: {pair: $id, hourStartUnix_gt: $since}) { hourlyVolumeUSD } }";

json ParseData(const std::string& raw) {
  json j = json::parse(raw, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("subgraph returned malformed JSON");
  if (j.contains("errors")) throw std::runtime_error("subgraph error: " + j["errors"].dump());
  if (!j.contains("data") || !j["data"].is_object()) throw std::runtime_error("subgraph response has no data");
  return j["data"];
}
}

std::vector<double> SeriesValues(const std::vector<DailyPoint>& series) {
  std::vector<double> out;
  out.reserve(series.size());
  for (const auto& p : series) out.push_back(p.value);
  return out;
}

std::string SubgraphHistoryProvider::Query(const std::string& query, const std::string& variables_json) {
  json body;
  body["query"] = query;
  body["variables"] = json::parse(variables_json);
  auto resp = http_.Post(url_, body.dump(), {{"Content-Type", "application/json"}}, timeout_ms_);
  if (resp.status == 0) throw std::runtime_error("subgraph transport failure: " + resp.error);
  if (resp.status < 200 || resp.status >= 300) {
    throw std::runtime_error("subgraph HTTP " + std::to_string(resp.status));
  }
  return resp.body;
}

std::vector<DailyPoint> SubgraphHistoryProvider::DailySeries(SeriesKind kind, const std::string& entity, int days) {
  if (days <= 0) return {};
  json vars;
  vars["id"] = NormalizeAddress(entity);
  vars["days"] = days;
  const bool token = kind == SeriesKind::TokenPrice;
  const auto raw = Query(token ? kTokenSeriesQuery : kPairSeriesQuery, vars.dump());

  const json data = ParseData(raw);

  const char* collection = token ? "tokenDayDatas" : "pairDayDatas";
  const char* field = token ? "priceUSD" : "reserveUSD";
  const auto& rows = data.at(collection);

  // Rows arrive newest first.
  std::vector<DailyPoint> out;
  out.reserve(rows.size());
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
    DailyPoint p;
    p.date = it->at("date").get<long long>();
    p.value = NumberField(*it, field);
    out.push_back(p);
  }
  Logger::Debug("subgraph " + std::string(collection) + " " + NormalizeAddress(entity) + ": " +
                std::to_string(out.size()) + " points", __FILE__, __LINE__);
  return out;
}

std::optional<double> SubgraphHistoryProvider::AgeDays(SeriesKind kind, const std::string& entity) {
  json vars;
  vars["id"] = NormalizeAddress(entity);
  const bool token = kind == SeriesKind::TokenPrice;
  const json data = ParseData(Query(token ? kTokenFirstDayQuery : kPairFirstDayQuery, vars.dump()));

  const auto& rows = data.at(token ? "tokenDayDatas" : "pairDayDatas");
  if (rows.empty()) return std::nullopt;
  const long long first = rows.front().at("date").get<long long>();
  const long long now = static_cast<long long>(std::time(nullptr));
  if (first <= 0 || first > now) return std::nullopt;
  return static_cast<double>(now - first) / 86400.0;
}

std::optional<PairActivity> SubgraphHistoryProvider::Activity(const std::string& pair) {
  json vars;
  vars["id"] = NormalizeAddress(pair);
  vars["since"] = static_cast<long long>(std::time(nullptr)) - 86400;
  const json data = ParseData(Query(kPairActivityQuery, vars.dump()));

  if (!data.contains("pair") || data["pair"].is_null()) return std::nullopt;
  PairActivity a;
  a.volume_usd = NumberField(data["pair"], "volumeUSD");
  a.tx_count = static_cast<long long>(NumberField(data["pair"], "txCount"));
  if (data.contains("pairHourDatas")) {
    for (const auto& hour : data["pairHourDatas"]) a.volume_24h_usd += NumberField(hour, "hourlyVolumeUSD");
  }
  return a;
}

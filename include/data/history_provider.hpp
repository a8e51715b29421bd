#pragma once
#include <optional>
#include <string>
#include <vector>

class HttpClient;

struct DailyPoint {
  long long date = 0;  // unix seconds, start of day
  double value = 0.0;
};

// Trading activity of one liquidity pair.
struct PairActivity {
  double volume_24h_usd = 0.0;  // summed over the hourly buckets of the last 24 hours
  double volume_usd = 0.0;      // since the pair was created
  long long tx_count = 0;
};

enum class SeriesKind {
  TokenPrice,  // USD price of a token
  PairTvl      // USD reserve value of a liquidity pair
};

// Historical daily data. Series are returned oldest first; implementations throw
// std::runtime_error on transport or query errors.
class HistoryProvider {
public:
  virtual ~HistoryProvider() = default;
  virtual std::vector<DailyPoint> DailySeries(SeriesKind kind, const std::string& entity, int days) = 0;
  // Days since the first recorded day; nullopt when the entity has no history.
  virtual std::optional<double> AgeDays(SeriesKind kind, const std::string& entity) = 0;
  // nullopt when the pair is unknown to the source.
  virtual std::optional<PairActivity> Activity(const std::string& pair) = 0;
};

// Values of a series without the dates.
std::vector<double> SeriesValues(const std::vector<DailyPoint>& series);

// Uniswap-V2 exchange subgraph (tokenDayDatas, pairDayDatas, pairHourDatas) over GraphQL.
class SubgraphHistoryProvider : public HistoryProvider {
public:
  SubgraphHistoryProvider(HttpClient& http, std::string url, int timeout_ms = 10000)
    : http_(http), url_(std::move(url)), timeout_ms_(timeout_ms) {}

  std::vector<DailyPoint> DailySeries(SeriesKind kind, const std::string& entity, int days) override;
  std::optional<double> AgeDays(SeriesKind kind, const std::string& entity) override;
  std::optional<PairActivity> Activity(const std::string& pair) override;

private:
  // Posts one GraphQL query; returns the raw response body.
  std::string Query(const std::string& query, const std::string& variables_json);

  HttpClient& http_;
  std::string url_;
  int timeout_ms_;
};

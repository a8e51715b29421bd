#include "report/opportunity_report.hpp"
#include "scanner/scan_orchestrator.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
std::string Quote(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += '"';
  return out;
}

std::string Iso8601(long long unix_s) {
  std::time_t t = static_cast<std::time_t>(unix_s);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}
}

namespace OpportunityReport {
  nlohmann::json ToJson(const Opportunity& o) {
    nlohmann::json j;
    j["protocol"] = o.protocol;
    j["type"] = OpportunityTypeName(o.type);
    j["address"] = o.address;
    j["label"] = o.label;
    j["tvl_usd"] = o.tvl_usd;
    j["rate"] = o.rate;
    j["rate_kind"] = RateKindName(o.rate_kind);
    j["base_rate"] = o.base_rate;
    j["reward_rate"] = o.reward_rate;
    j["risk_score"] = o.risk_score;
    j["risk_factors"] = {
      {"tvl", o.factors.tvl_risk},
      {"volatility", o.factors.volatility_risk},
      {"age", o.factors.age_risk},
      {"impermanent_loss", o.factors.il_risk},
      {"protocol_reputation", o.factors.protocol_reputation},
    };
    j["expected_roi"] = o.expected_roi;
    j["timestamp"] = Iso8601(o.timestamp);
    if (!o.extras.empty()) j["extras"] = o.extras;
    return j;
  }

  nlohmann::json ToJson(const std::vector<Opportunity>& list) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& o : list) arr.push_back(ToJson(o));
    return arr;
  }

  std::string CsvHeader() {
    return "Protocol,Type,Address,Label,TVL_USD,Rate,Rate_Kind,Base_Rate,Reward_Rate,Risk_Score,Expected_ROI,Timestamp";
  }

  std::string CsvRow(const Opportunity& o) {
    std::ostringstream oss;
    oss << Quote(o.protocol) << ','
        << OpportunityTypeName(o.type) << ','
        << Quote(o.address) << ','
        << Quote(o.label) << ','
        << std::fixed << std::setprecision(2) << o.tvl_usd << ','
        << std::setprecision(4) << o.rate << ','
        << RateKindName(o.rate_kind) << ','
        << o.base_rate << ','
        << o.reward_rate << ','
        << std::setprecision(6) << o.risk_score << ','
        << o.expected_roi << ','
        << Iso8601(o.timestamp);
    return oss.str();
  }

  void WriteJson(const std::string& path, const std::vector<Opportunity>& list) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot open JSON report " + path);
    out << ToJson(list).dump(2) << '\n';
    if (!out) throw std::runtime_error("failed writing JSON report " + path);
  }

  void WriteCsv(const std::string& path, const std::vector<Opportunity>& list) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot open CSV report " + path);
    out << CsvHeader() << '\n';
    for (const auto& o : list) out << CsvRow(o) << '\n';
    if (!out) throw std::runtime_error("failed writing CSV report " + path);
  }

  void PrintSummary(std::ostream& out, const ScanReport& report, size_t limit) {
    out << "block " << report.block << ": " << report.pools_total << " pools, "
        << report.evaluated << " evaluated, " << report.opportunities.size() << " ranked, "
        << report.failures.size() << " pool failures, " << report.adapter_failures.size()
        << " adapter failures" << (report.cancelled ? " (cancelled)" : "") << '\n';
    for (const auto& f : report.adapter_failures) out << "  adapter " << f.protocol << " failed: " << f.message << '\n';
    if (report.opportunities.empty()) return;

    out << std::left << std::setw(4) << "#" << std::setw(13) << "protocol" << std::setw(9) << "type"
        << std::setw(28) << "label" << std::right << std::setw(16) << "tvl_usd" << std::setw(12) << "rate%" << "     "
        << std::setw(8) << "risk" << std::setw(10) << "roi" << '\n';
    size_t rank = 0;
    for (const auto& o : report.opportunities) {
      if (rank >= limit) break;
      ++rank;
      std::string label = o.label.size() > 26 ? o.label.substr(0, 26) : o.label;
      out << std::left << std::setw(4) << rank << std::setw(13) << o.protocol << std::setw(9) << OpportunityTypeName(o.type)
          << std::setw(28) << label << std::right << std::fixed << std::setprecision(0) << std::setw(16) << o.tvl_usd
          << std::setprecision(2) << std::setw(12) << o.rate << ' ' << std::left << std::setw(4) << RateKindName(o.rate_kind) << std::right
          << std::setprecision(3) << std::setw(8) << o.risk_score << std::setw(10) << o.expected_roi << '\n';
    }
  }
}

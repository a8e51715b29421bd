#pragma once
#include "scanner/opportunity.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

struct ScanReport;

namespace OpportunityReport {
  nlohmann::json ToJson(const Opportunity& o);
  nlohmann::json ToJson(const std::vector<Opportunity>& list);

  std::string CsvHeader();
  std::string CsvRow(const Opportunity& o);

  // Both writers truncate the target and throw std::runtime_error if it cannot be written.
  void WriteJson(const std::string& path, const std::vector<Opportunity>& list);
  void WriteCsv(const std::string& path, const std::vector<Opportunity>& list);

  // Fixed-width summary of the top `limit` opportunities plus the scan's failure counts.
  void PrintSummary(std::ostream& out, const ScanReport& report, size_t limit = 20);
}

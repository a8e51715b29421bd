#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","method":...,"params":...,"id":...} serialized.
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, unsigned long long id);
  // Returns the "result" field as string (raw), throws on error or malformed body
  std::string ExtractResult(const std::string& json_body);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}

#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>
#include <stdexcept>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; a bare value is sent as Authorization.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int default_timeout_ms)
  : http_(http), endpoint_(endpoint_url), default_timeout_ms_(default_timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, Timeout(timeout_ms));
  if (resp.status == 0) {
    throw std::runtime_error("RPC transport failure: " + resp.error);
  }
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("RPC POST failed status=" + std::to_string(resp.status), __FILE__, __LINE__);
    throw std::runtime_error("RPC POST failed with HTTP " + std::to_string(resp.status));
  }
  return resp.body;
}

std::string RpcClient::Request(const std::string& method, const nlohmann::json& params, int timeout_ms) {
  auto payload = JsonRpcUtil::BuildRequest(method, params, next_id_.fetch_add(1, std::memory_order_relaxed));
  return JsonRpcUtil::ExtractResult(Send(payload, timeout_ms));
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block, int timeout_ms) {
  nlohmann::json call = {{"to", to}, {"data", data}};
  return Request("eth_call", nlohmann::json::array({call, block.value_or("latest")}), timeout_ms);
}

std::string RpcClient::EthBlockNumber(int timeout_ms) {
  return Request("eth_blockNumber", nlohmann::json::array(), timeout_ms);
}

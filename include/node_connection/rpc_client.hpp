#pragma once
#include <atomic>
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

// Thin JSON-RPC client for read-only node access. Transport and node errors throw std::runtime_error.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int default_timeout_ms = 5000);
  // Sends raw JSON-RPC payload and returns the raw response body.
  std::string Send(const std::string& json_payload, int timeout_ms);
  // Builds, sends and unwraps one request; returns the "result" field.
  std::string Request(const std::string& method, const nlohmann::json& params, int timeout_ms = -1);

  std::string EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block = std::nullopt, int timeout_ms = -1);
  std::string EthBlockNumber(int timeout_ms = -1);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  int default_timeout_ms_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::atomic<unsigned long long> next_id_{1};
  int Timeout(int timeout_ms) const { return timeout_ms > 0 ? timeout_ms : default_timeout_ms_; }
};

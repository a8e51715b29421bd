#include "utils/json_rpc.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const json& params, unsigned long long id) {
    json req = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}};
    return req.dump();
  }
  std::string ExtractResult(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw std::runtime_error("malformed JSON-RPC response");
    if (j.contains("error") && !j["error"].is_null()) throw std::runtime_error("JSON-RPC error: " + j["error"].dump());
    if (!j.contains("result")) throw std::runtime_error("missing result");
    if (j["result"].is_string()) return j["result"].get<std::string>();
    return j["result"].dump();
  }
  std::string ExtractError(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::string();
    if (j.contains("error") && !j["error"].is_null()) return j["error"].dump();
    return std::string();
  }
}

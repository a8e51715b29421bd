#include "node_connection/contract_reader.hpp"
#include "node_connection/rpc_client.hpp"
#include "encoding/abi.hpp"
#include "utils/hex.hpp"
#include <mutex>
#include <stdexcept>
#include <unordered_map>

// Selectors are derived once per signature.
static std::string CachedSelector(const std::string& signature) {
  static std::mutex mutex;
  static std::unordered_map<std::string, std::string> cache;
  std::lock_guard<std::mutex> lock(mutex);
  auto it = cache.find(signature);
  if (it != cache.end()) return it->second;
  auto sel = Abi::Selector(signature);
  cache.emplace(signature, sel);
  return sel;
}

std::string RpcContractReader::Call(const std::string& address,
                                    const std::string& signature,
                                    const std::vector<std::string>& args) {
  std::string data = CachedSelector(signature);
  for (const auto& a : args) data += Strip0x(a);
  return rpc_.EthCall(address, data, std::nullopt, timeout_ms_);
}

unsigned long long RpcContractReader::BlockNumber() {
  const std::string hex = Strip0x(rpc_.EthBlockNumber(timeout_ms_));
  if (hex.empty()) throw std::runtime_error("empty eth_blockNumber result");
  return std::stoull(hex, nullptr, 16);
}

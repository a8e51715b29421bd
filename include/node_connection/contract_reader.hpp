#pragma once
#include <string>
#include <vector>

class RpcClient;

// Read-only contract access. Implementations throw std::runtime_error on transport or
// node errors; an empty return ("0x") is passed through for the caller to judge.
class ContractReader {
public:
  virtual ~ContractReader() = default;
  // `signature` is the Solidity signature, e.g. "poolInfo(uint256)"; `args` are ABI words.
  virtual std::string Call(const std::string& address,
                           const std::string& signature,
                           const std::vector<std::string>& args = {}) = 0;
  virtual unsigned long long BlockNumber() = 0;
};

class RpcContractReader : public ContractReader {
public:
  explicit RpcContractReader(RpcClient& rpc, int timeout_ms = 5000) : rpc_(rpc), timeout_ms_(timeout_ms) {}
  std::string Call(const std::string& address,
                   const std::string& signature,
                   const std::vector<std::string>& args = {}) override;
  unsigned long long BlockNumber() override;
private:
  RpcClient& rpc_;
  int timeout_ms_;
};

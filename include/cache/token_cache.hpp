#pragma once
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

class ContractReader;

struct Token {
  std::string address;
  std::string symbol;
  int decimals = 18;
  std::optional<double> price_usd;  // filled by the adapter once resolved
};

// ERC-20 metadata for one scan cycle. Clear() between cycles forces a re-fetch.
class TokenCache {
public:
  explicit TokenCache(ContractReader& reader) : reader_(reader) {}
  // Throws when decimals() cannot be read; a missing symbol falls back to "?".
  Token Get(const std::string& address);
  void Put(const Token& token);
  void Clear();
  size_t Size() const;
private:
  ContractReader& reader_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Token> cache_;
};

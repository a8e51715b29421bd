#pragma once
#include <string>
#include <vector>

// Minimal Solidity ABI helpers for static-word calls and returns.
// Encoders produce 64-char hex words without 0x; decoders accept 0x-hex return data.
namespace Abi {
  // First four bytes of keccak256(signature) as 0x-prefixed hex, e.g. "0x313ce567".
  std::string Selector(const std::string& signature);

  std::string EncodeAddress(const std::string& address);
  std::string EncodeUint(unsigned long long value);
  std::string EncodeBool(bool value);
  // Joins words into one 0x-prefixed blob, handy for building return data in tests.
  std::string Pack(const std::vector<std::string>& words);

  size_t WordCount(const std::string& data);
  // Throws std::out_of_range when the return data is shorter than the requested word.
  std::string Word(const std::string& data, size_t index);
  std::string DecodeAddress(const std::string& data, size_t index = 0);
  // Full 256-bit unsigned word; precision beyond 64 mantissa bits is rounded.
  long double DecodeUint(const std::string& data, size_t index = 0);
  // Throws std::overflow_error if the word does not fit 64 bits.
  unsigned long long DecodeUint64(const std::string& data, size_t index = 0);
  // Dynamic address[] return value at the head offset stored in word `index`.
  std::vector<std::string> DecodeAddressArray(const std::string& data, size_t index = 0);
  // Dynamic string return value; also accepts the legacy bytes32 encoding.
  std::string DecodeString(const std::string& data, size_t index = 0);
}

#pragma once
#include <string>

namespace Crypto {
  // Returns 0x-prefixed hex keccak256 (Ethereum variant, not SHA3-256) of the raw input bytes.
  std::string Keccak256Raw(const std::string& raw);
}

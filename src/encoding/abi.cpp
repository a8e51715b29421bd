#include "encoding/abi.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <sstream>
#include <stdexcept>

static std::string Pad32(const std::string& no0x) {
  if (no0x.size() >= 64) return no0x.substr(no0x.size() - 64);
  return std::string(64 - no0x.size(), '0') + no0x;
}

namespace Abi {
  std::string Selector(const std::string& signature) {
    auto digest = Strip0x(Crypto::Keccak256Raw(signature));
    if (digest.size() < 8) throw std::runtime_error("keccak256 unavailable for selector: " + signature);
    return "0x" + digest.substr(0, 8);
  }

  std::string EncodeAddress(const std::string& address) {
    return Pad32(ToLowerHex(Strip0x(address)));
  }

  std::string EncodeUint(unsigned long long value) {
    std::ostringstream ss;
    ss << std::hex << std::nouppercase << value;
    return Pad32(ss.str());
  }

  std::string EncodeBool(bool value) {
    return std::string(63, '0') + (value ? '1' : '0');
  }

  std::string Pack(const std::vector<std::string>& words) {
    std::string out = "0x";
    for (const auto& w : words) out += Pad32(Strip0x(w));
    return out;
  }

  size_t WordCount(const std::string& data) {
    return Strip0x(data).size() / 64;
  }

  std::string Word(const std::string& data, size_t index) {
    const std::string hex = Strip0x(data);
    if (hex.size() < (index + 1) * 64) {
      throw std::out_of_range("ABI return data too short: need word " + std::to_string(index) +
                              ", have " + std::to_string(hex.size() / 64));
    }
    return hex.substr(index * 64, 64);
  }

  std::string DecodeAddress(const std::string& data, size_t index) {
    return "0x" + ToLowerHex(Word(data, index).substr(24, 40));
  }

  long double DecodeUint(const std::string& data, size_t index) {
    long double v = 0.0L;
    for (char c : Word(data, index)) {
      int d = HexDigitValue(c);
      if (d < 0) throw std::invalid_argument("invalid hex in ABI word");
      v = v * 16.0L + static_cast<long double>(d);
    }
    return v;
  }

  unsigned long long DecodeUint64(const std::string& data, size_t index) {
    const std::string w = Word(data, index);
    if (w.find_first_not_of('0') < 48) throw std::overflow_error("ABI word exceeds 64 bits");
    return std::stoull(w.substr(48), nullptr, 16);
  }

  std::vector<std::string> DecodeAddressArray(const std::string& data, size_t index) {
    const unsigned long long offset = DecodeUint64(data, index);
    if (offset % 32 != 0) throw std::invalid_argument("misaligned ABI array offset");
    const size_t base = static_cast<size_t>(offset / 32);
    const unsigned long long length = DecodeUint64(data, base);
    if (length > WordCount(data)) throw std::out_of_range("ABI array length exceeds return data");
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(length));
    for (size_t i = 0; i < length; ++i) out.push_back(DecodeAddress(data, base + 1 + i));
    return out;
  }

  std::string DecodeString(const std::string& data, size_t index) {
    auto bytes_from_hex = [](const std::string& hex, size_t n) {
      std::string out;
      out.reserve(n);
      for (size_t i = 0; i + 1 < hex.size() && out.size() < n; i += 2) {
        int hi = HexDigitValue(hex[i]), lo = HexDigitValue(hex[i + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex in ABI string");
        out.push_back(static_cast<char>((hi << 4) | lo));
      }
      return out;
    };
    // A single 32-byte word is the bytes32 form (older tokens such as MKR).
    if (WordCount(data) == 1) {
      std::string s = bytes_from_hex(Word(data, 0), 32);
      auto end = s.find('\0');
      return end == std::string::npos ? s : s.substr(0, end);
    }
    const unsigned long long offset = DecodeUint64(data, index);
    const size_t base = static_cast<size_t>(offset / 32);
    const unsigned long long length = DecodeUint64(data, base);
    const std::string hex = Strip0x(data);
    const size_t start = (base + 1) * 64;
    if (start > hex.size() || length > (hex.size() - start) / 2) {
      throw std::out_of_range("ABI string exceeds return data");
    }
    return bytes_from_hex(hex.substr(start, static_cast<size_t>(length * 2)), static_cast<size_t>(length));
  }
}

#pragma once
#include <string>
#include <algorithm>
#include <cctype>

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// -1 for a non-hex character.
inline int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

// Canonical form used as a map key: lowercase with 0x prefix.
inline std::string NormalizeAddress(const std::string& address) {
  return "0x" + ToLowerHex(Strip0x(address));
}

inline bool SameAddress(const std::string& a, const std::string& b) {
  return NormalizeAddress(a) == NormalizeAddress(b);
}

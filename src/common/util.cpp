#include "util.hpp"
#include <cctype>

namespace tftpwire {

static int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  std::string digits;
  digits.reserve(hex.size());
  for (char c : hex) {
    if (std::isspace((unsigned char)c))
      continue;
    digits.push_back(c);
  }
  if (digits.empty() || (digits.size() % 2) != 0)
    return out;
  out.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    int hi = hex_digit(digits[i]);
    int lo = hex_digit(digits[i + 1]);
    if (hi < 0 || lo < 0)
      return std::vector<uint8_t>();
    out.push_back((uint8_t)((hi << 4) | lo));
  }
  return out;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  if (len == 0)
    return out;
  out.reserve(len * 3 - 1);
  for (size_t i = 0; i < len; i++) {
    if (i)
      out.push_back(' ');
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

} // namespace tftpwire

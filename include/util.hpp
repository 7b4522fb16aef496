#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace tftpwire {

// Whitespace between byte pairs is skipped. Returns an empty vector on
// odd length or non-hex characters.
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string bytes_to_hex(const uint8_t* data, size_t len);

} // namespace tftpwire

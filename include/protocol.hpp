#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include "errors.hpp"

namespace tftpwire {

enum class Opcode : uint16_t {
    RRQ = 1,
    WRQ = 2,
    DATA = 3,
    ACK = 4,
    ERROR = 5
};

constexpr size_t   kOpcodeSize = 2;
constexpr size_t   kDataHeaderSize = 4;
constexpr size_t   kAckSize = 4;
constexpr size_t   kMinRequestSize = 6;   // opcode + 1 + NUL + 1 + NUL
constexpr size_t   kMinErrorSize = 5;     // opcode + code + NUL
constexpr size_t   kMaxDataSize = 512;
constexpr size_t   kMaxPacketSize = kDataHeaderSize + kMaxDataSize;
constexpr uint16_t kMaxErrorCode = 7;

// Every packet type exposes the same encode member. On failure `out` is
// left empty and `err` describes the violation.

struct ReadRequest {
    std::string filename;
    std::string mode;
    bool encode(std::vector<uint8_t>& out, Error& err) const;
};

struct WriteRequest {
    std::string filename;
    std::string mode;
    bool encode(std::vector<uint8_t>& out, Error& err) const;
};

struct DataPacket {
    uint16_t block{};
    std::vector<uint8_t> payload;
    bool encode(std::vector<uint8_t>& out, Error& err) const;
};

struct AckPacket {
    uint16_t block{};
    bool encode(std::vector<uint8_t>& out, Error& err) const;
};

struct ErrorPacket {
    uint16_t code{};
    std::string message;
    bool encode(std::vector<uint8_t>& out, Error& err) const;
};

using Packet = std::variant<ReadRequest, WriteRequest, DataPacket, AckPacket, ErrorPacket>;

bool operator==(const ReadRequest& a, const ReadRequest& b);
bool operator==(const WriteRequest& a, const WriteRequest& b);
bool operator==(const DataPacket& a, const DataPacket& b);
bool operator==(const AckPacket& a, const AckPacket& b);
bool operator==(const ErrorPacket& a, const ErrorPacket& b);
inline bool operator!=(const ReadRequest& a, const ReadRequest& b) { return !(a == b); }
inline bool operator!=(const WriteRequest& a, const WriteRequest& b) { return !(a == b); }
inline bool operator!=(const DataPacket& a, const DataPacket& b) { return !(a == b); }
inline bool operator!=(const AckPacket& a, const AckPacket& b) { return !(a == b); }
inline bool operator!=(const ErrorPacket& a, const ErrorPacket& b) { return !(a == b); }

Opcode opcode_of(const Packet& p);
const char* opcode_name(Opcode op);
std::string describe(const Packet& p);

bool encode(const Packet& p, std::vector<uint8_t>& out, Error& err);

// Reads the leading opcode without validating the rest of the datagram.
bool peek_opcode(const uint8_t* data, size_t len, uint16_t& opcode);

bool decode(const uint8_t* data, size_t len, Packet& out, Error& err);
bool decode(const std::vector<uint8_t>& buf, Packet& out, Error& err);

} // namespace tftpwire

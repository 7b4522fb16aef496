#include "protocol.hpp"
#include <cstdio>

namespace tftpwire {

static void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)(v & 0xFF));
}

// Appends `s` followed by its NUL terminator. A string holding a NUL would
// be cut short on the wire, so it cannot be written in full.
static bool put_cstr(std::vector<uint8_t> &out, const std::string &s,
                     const char *field, Error &err) {
  if (s.find('\0') != std::string::npos) {
    err = not_defined(std::string("length of ") + field +
                      " did not match that written to buffer");
    return false;
  }
  out.insert(out.end(), s.begin(), s.end());
  out.push_back(0x00);
  return true;
}

static bool encode_request(Opcode op, const std::string &filename,
                           const std::string &mode, std::vector<uint8_t> &out,
                           Error &err) {
  std::vector<uint8_t> buf;
  buf.reserve(kOpcodeSize + filename.size() + mode.size() + 2);
  put_u16(buf, static_cast<uint16_t>(op));
  if (!put_cstr(buf, filename, "filename", err) ||
      !put_cstr(buf, mode, "mode", err)) {
    out.clear();
    return false;
  }
  out.swap(buf);
  return true;
}

bool ReadRequest::encode(std::vector<uint8_t> &out, Error &err) const {
  return encode_request(Opcode::RRQ, filename, mode, out, err);
}

bool WriteRequest::encode(std::vector<uint8_t> &out, Error &err) const {
  return encode_request(Opcode::WRQ, filename, mode, out, err);
}

bool DataPacket::encode(std::vector<uint8_t> &out, Error &) const {
  std::vector<uint8_t> buf;
  buf.reserve(kDataHeaderSize + payload.size());
  put_u16(buf, static_cast<uint16_t>(Opcode::DATA));
  put_u16(buf, block);
  buf.insert(buf.end(), payload.begin(), payload.end());
  out.swap(buf);
  return true;
}

bool AckPacket::encode(std::vector<uint8_t> &out, Error &) const {
  std::vector<uint8_t> buf;
  buf.reserve(kAckSize);
  put_u16(buf, static_cast<uint16_t>(Opcode::ACK));
  put_u16(buf, block);
  out.swap(buf);
  return true;
}

bool ErrorPacket::encode(std::vector<uint8_t> &out, Error &err) const {
  if (code > kMaxErrorCode) {
    err = not_defined("invalid error code " + std::to_string(code) +
                      " - must be between 0 and 7");
    out.clear();
    return false;
  }
  std::vector<uint8_t> buf;
  buf.reserve(kMinErrorSize + message.size());
  put_u16(buf, static_cast<uint16_t>(Opcode::ERROR));
  put_u16(buf, code);
  if (!put_cstr(buf, message, "error message", err)) {
    out.clear();
    return false;
  }
  out.swap(buf);
  return true;
}

bool encode(const Packet &p, std::vector<uint8_t> &out, Error &err) {
  return std::visit([&](const auto &pkt) { return pkt.encode(out, err); }, p);
}

bool operator==(const ReadRequest &a, const ReadRequest &b) {
  return a.filename == b.filename && a.mode == b.mode;
}

bool operator==(const WriteRequest &a, const WriteRequest &b) {
  return a.filename == b.filename && a.mode == b.mode;
}

bool operator==(const DataPacket &a, const DataPacket &b) {
  return a.block == b.block && a.payload == b.payload;
}

bool operator==(const AckPacket &a, const AckPacket &b) {
  return a.block == b.block;
}

bool operator==(const ErrorPacket &a, const ErrorPacket &b) {
  return a.code == b.code && a.message == b.message;
}

namespace {

struct OpcodeOf {
  Opcode operator()(const ReadRequest &) const { return Opcode::RRQ; }
  Opcode operator()(const WriteRequest &) const { return Opcode::WRQ; }
  Opcode operator()(const DataPacket &) const { return Opcode::DATA; }
  Opcode operator()(const AckPacket &) const { return Opcode::ACK; }
  Opcode operator()(const ErrorPacket &) const { return Opcode::ERROR; }
};

} // namespace

Opcode opcode_of(const Packet &p) { return std::visit(OpcodeOf{}, p); }

const char *opcode_name(Opcode op) {
  switch (op) {
  case Opcode::RRQ:
    return "RRQ";
  case Opcode::WRQ:
    return "WRQ";
  case Opcode::DATA:
    return "DATA";
  case Opcode::ACK:
    return "ACK";
  case Opcode::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

namespace {

struct Describer {
  std::string operator()(const ReadRequest &r) const {
    return "RRQ file=\"" + r.filename + "\" mode=\"" + r.mode + "\"";
  }
  std::string operator()(const WriteRequest &w) const {
    return "WRQ file=\"" + w.filename + "\" mode=\"" + w.mode + "\"";
  }
  std::string operator()(const DataPacket &d) const {
    char head[48];
    std::snprintf(head, sizeof(head), "DATA block=%u len=%zu",
                  (unsigned)d.block, d.payload.size());
    return head;
  }
  std::string operator()(const AckPacket &a) const {
    return "ACK block=" + std::to_string(a.block);
  }
  std::string operator()(const ErrorPacket &e) const {
    return "ERROR code=" + std::to_string(e.code) + " msg=\"" + e.message +
           "\"";
  }
};

} // namespace

std::string describe(const Packet &p) { return std::visit(Describer{}, p); }

} // namespace tftpwire

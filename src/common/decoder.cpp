#include "logging.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstring>

namespace tftpwire {

static constexpr size_t kLogPreviewBytes = 16;

static uint16_t get_u16(const uint8_t *p) {
  return (uint16_t)((p[0] << 8) | p[1]);
}

static bool reject(const uint8_t *data, size_t len, Error &err,
                   const std::string &why) {
  err = illegal_operation(why);
  Logger &log = Logger::instance();
  if (log.enabled(LogLevel::DEBUG)) {
    std::string hex = bytes_to_hex(data, std::min(len, kLogPreviewBytes));
    log.log(LogLevel::DEBUG, "decode: rejected %zu byte packet [%s%s]: %s",
            len, hex.c_str(), len > kLogPreviewBytes ? " ..." : "",
            why.c_str());
  }
  return false;
}

// Reads a NUL terminated field starting at `*pos`. On success `*pos` is
// moved past the terminator.
static bool read_cstr(const uint8_t *data, size_t len, size_t *pos,
                      std::string &out) {
  if (*pos >= len)
    return false;
  const uint8_t *start = data + *pos;
  const void *end = std::memchr(start, 0x00, len - *pos);
  if (end == nullptr)
    return false;
  size_t n = (size_t)((const uint8_t *)end - start);
  out.assign((const char *)start, n);
  *pos += n + 1;
  return true;
}

// Shared by RRQ and WRQ. Anything after the mode terminator (e.g. option
// extensions) is ignored.
static bool decode_request(const uint8_t *data, size_t len,
                           std::string &filename, std::string &mode,
                           Error &err) {
  if (len < kMinRequestSize)
    return reject(data, len, err, "request not long enough");

  size_t pos = kOpcodeSize;
  if (!read_cstr(data, len, &pos, filename))
    return reject(data, len, err, "non-terminated filename");
  if (filename.empty())
    return reject(data, len, err, "blank filename");

  if (!read_cstr(data, len, &pos, mode))
    return reject(data, len, err, "non-terminated mode");
  if (mode.empty())
    return reject(data, len, err, "blank mode");
  return true;
}

static bool decode_data(const uint8_t *data, size_t len, Packet &out,
                        Error &err) {
  if (len < kDataHeaderSize)
    return reject(data, len, err, "data packet too short");
  DataPacket d;
  d.block = get_u16(data + 2);
  d.payload.assign(data + kDataHeaderSize, data + len);
  out = std::move(d);
  return true;
}

static bool decode_ack(const uint8_t *data, size_t len, Packet &out,
                       Error &err) {
  if (len != kAckSize)
    return reject(data, len, err, "invalid ack length - must be 4 bytes");
  AckPacket a;
  a.block = get_u16(data + 2);
  out = a;
  return true;
}

static bool decode_error(const uint8_t *data, size_t len, Packet &out,
                         Error &err) {
  if (len < kMinErrorSize)
    return reject(data, len, err,
                  "invalid error packet length - must be at least 5 bytes");
  ErrorPacket e;
  e.code = get_u16(data + 2);
  if (e.code > kMaxErrorCode)
    return reject(data, len, err,
                  "invalid error code " + std::to_string(e.code) +
                      " - must be between 0 and 7");
  size_t pos = 4;
  if (!read_cstr(data, len, &pos, e.message))
    return reject(data, len, err, "error message not terminated");
  out = std::move(e);
  return true;
}

bool peek_opcode(const uint8_t *data, size_t len, uint16_t &opcode) {
  if (data == nullptr || len < kOpcodeSize)
    return false;
  opcode = get_u16(data);
  return true;
}

bool decode(const uint8_t *data, size_t len, Packet &out, Error &err) {
  uint16_t op = 0;
  if (!peek_opcode(data, len, op))
    return reject(data, data ? len : 0, err, "no data in packet");

  switch (static_cast<Opcode>(op)) {
  case Opcode::RRQ: {
    ReadRequest r;
    if (!decode_request(data, len, r.filename, r.mode, err))
      return false;
    out = std::move(r);
    return true;
  }
  case Opcode::WRQ: {
    WriteRequest w;
    if (!decode_request(data, len, w.filename, w.mode, err))
      return false;
    out = std::move(w);
    return true;
  }
  case Opcode::DATA:
    return decode_data(data, len, out, err);
  case Opcode::ACK:
    return decode_ack(data, len, out, err);
  case Opcode::ERROR:
    return decode_error(data, len, out, err);
  }
  return reject(data, len, err, "unknown opcode - " + std::to_string(op));
}

bool decode(const std::vector<uint8_t> &buf, Packet &out, Error &err) {
  return decode(buf.data(), buf.size(), out, err);
}

} // namespace tftpwire

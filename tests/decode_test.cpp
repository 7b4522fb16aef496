#include "protocol.hpp"
#include "util.hpp"
#include <gtest/gtest.h>

using namespace tftpwire;

namespace {

std::vector<uint8_t> raw(const std::string &s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

void expect_illegal(const std::vector<uint8_t> &buf, const char *why) {
  Packet p;
  Error err;
  EXPECT_FALSE(decode(buf, p, err)) << why;
  EXPECT_EQ(err.kind, ErrorKind::IllegalOperation) << why;
  EXPECT_EQ(err.detail, why);
}

} // namespace

TEST(Decode, AckScenario) {
  Packet p;
  Error err;
  ASSERT_TRUE(decode(hex_to_bytes("00 04 00 32"), p, err));
  ASSERT_TRUE(std::holds_alternative<AckPacket>(p));
  EXPECT_EQ(std::get<AckPacket>(p).block, 50);
}

TEST(Decode, ErrorScenario) {
  Packet p;
  Error err;
  ASSERT_TRUE(decode(hex_to_bytes("00 05 00 01 54 65 73 74 00"), p, err));
  ASSERT_TRUE(std::holds_alternative<ErrorPacket>(p));
  EXPECT_EQ(std::get<ErrorPacket>(p), (ErrorPacket{1, "Test"}));
}

TEST(Decode, ReadAndWriteRequests) {
  Packet p;
  Error err;
  ASSERT_TRUE(decode(raw(std::string("\x00\x01" "file.bin\0octet\0", 17)), p, err));
  ASSERT_TRUE(std::holds_alternative<ReadRequest>(p));
  EXPECT_EQ(std::get<ReadRequest>(p), (ReadRequest{"file.bin", "octet"}));

  ASSERT_TRUE(decode(raw(std::string("\x00\x02" "a\0b\0", 6)), p, err));
  ASSERT_TRUE(std::holds_alternative<WriteRequest>(p));
  EXPECT_EQ(std::get<WriteRequest>(p), (WriteRequest{"a", "b"}));
}

TEST(Decode, RequestIgnoresTrailingBytes) {
  Packet p;
  Error err;
  std::string wire("\x00\x01" "f\0octet\0blksize\0" "1428\0", 23);
  ASSERT_TRUE(decode(raw(wire), p, err));
  EXPECT_EQ(std::get<ReadRequest>(p), (ReadRequest{"f", "octet"}));
}

TEST(Decode, DataWithEmptyPayload) {
  Packet p;
  Error err;
  ASSERT_TRUE(decode(hex_to_bytes("00 03 ff ff"), p, err));
  ASSERT_TRUE(std::holds_alternative<DataPacket>(p));
  EXPECT_EQ(std::get<DataPacket>(p).block, 65535);
  EXPECT_TRUE(std::get<DataPacket>(p).payload.empty());
}

TEST(Decode, DataPayloadIsEverythingAfterHeader) {
  Packet p;
  Error err;
  ASSERT_TRUE(decode(hex_to_bytes("00 03 00 32 54 65 73 74 00 00"), p, err));
  EXPECT_EQ(std::get<DataPacket>(p),
            (DataPacket{50, {0x54, 0x65, 0x73, 0x74, 0x00, 0x00}}));
}

TEST(Decode, ErrorMessageMayBeEmpty) {
  Packet p;
  Error err;
  ASSERT_TRUE(decode(hex_to_bytes("00 05 00 07 00"), p, err));
  EXPECT_EQ(std::get<ErrorPacket>(p), (ErrorPacket{7, ""}));
}

TEST(Decode, ErrorIgnoresBytesAfterMessageTerminator) {
  Packet p;
  Error err;
  ASSERT_TRUE(decode(hex_to_bytes("00 05 00 01 54 00 78 79"), p, err));
  EXPECT_EQ(std::get<ErrorPacket>(p), (ErrorPacket{1, "T"}));
}

TEST(Decode, RejectsShortBuffers) {
  expect_illegal({}, "no data in packet");
  expect_illegal({0x00}, "no data in packet");

  Packet p;
  Error err;
  EXPECT_FALSE(decode(nullptr, 0, p, err));
  EXPECT_EQ(err.kind, ErrorKind::IllegalOperation);
}

TEST(Decode, RejectsUnknownOpcode) {
  expect_illegal(hex_to_bytes("00 00 00 00"), "unknown opcode - 0");
  expect_illegal(hex_to_bytes("00 06 00 00"), "unknown opcode - 6");
  expect_illegal(hex_to_bytes("01 01"), "unknown opcode - 257");
}

TEST(Decode, RejectsMalformedRequests) {
  expect_illegal(raw(std::string("\x00\x01" "ab\0", 5)),
                 "request not long enough");
  expect_illegal(raw(std::string("\x00\x01" "abcdef", 8)),
                 "non-terminated filename");
  expect_illegal(raw(std::string("\x00\x02" "\0octet\0", 9)),
                 "blank filename");
  expect_illegal(raw(std::string("\x00\x01" "file\0oct", 10)),
                 "non-terminated mode");
  expect_illegal(raw(std::string("\x00\x02" "file\0\0", 8)), "blank mode");
  expect_illegal(raw(std::string("\x00\x01" "file\0", 7)),
                 "non-terminated mode");
}

TEST(Decode, RejectsBadAckLength) {
  expect_illegal(hex_to_bytes("00 04 00"), "invalid ack length - must be 4 bytes");
  expect_illegal(hex_to_bytes("00 04 00 01 00"),
                 "invalid ack length - must be 4 bytes");
}

TEST(Decode, RejectsShortData) {
  expect_illegal(hex_to_bytes("00 03"), "data packet too short");
  expect_illegal(hex_to_bytes("00 03 00"), "data packet too short");
}

TEST(Decode, RejectsMalformedErrors) {
  expect_illegal(hex_to_bytes("00 05 00 01"),
                 "invalid error packet length - must be at least 5 bytes");
  expect_illegal(hex_to_bytes("00 05 00 01 54 65 73 74"),
                 "error message not terminated");
  expect_illegal(hex_to_bytes("00 05 00 08 00"),
                 "invalid error code 8 - must be between 0 and 7");
}

TEST(Decode, PeekOpcode) {
  uint16_t op = 0;
  auto buf = hex_to_bytes("00 05 ff");
  ASSERT_TRUE(peek_opcode(buf.data(), buf.size(), op));
  EXPECT_EQ(op, 5);
  EXPECT_FALSE(peek_opcode(buf.data(), 1, op));
}

TEST(Decode, DoesNotTouchOutputOnFailure) {
  Packet p = AckPacket{9};
  Error err;
  EXPECT_FALSE(decode(hex_to_bytes("00 04 00"), p, err));
  EXPECT_EQ(std::get<AckPacket>(p).block, 9);
}

class RoundTrip : public ::testing::TestWithParam<uint16_t> {};

TEST_P(RoundTrip, BlockNumbers) {
  uint16_t block = GetParam();
  std::vector<Packet> packets = {DataPacket{block, {}},
                                 DataPacket{block, std::vector<uint8_t>(512, 0x5A)},
                                 AckPacket{block}};
  for (const auto &in : packets) {
    std::vector<uint8_t> wire;
    Error err;
    ASSERT_TRUE(encode(in, wire, err));
    Packet out;
    ASSERT_TRUE(decode(wire, out, err)) << err.message();
    EXPECT_TRUE(in == out) << describe(in) << " vs " << describe(out);
  }
}

INSTANTIATE_TEST_SUITE_P(Boundaries, RoundTrip,
                         ::testing::Values(uint16_t{0}, uint16_t{1},
                                           uint16_t{65535}));

TEST(Decode, RoundTripErrorCodesAndRequests) {
  for (uint16_t code = 0; code <= kMaxErrorCode; code++) {
    Packet in = ErrorPacket{code, "message " + std::to_string(code)};
    std::vector<uint8_t> wire;
    Error err;
    ASSERT_TRUE(encode(in, wire, err));
    Packet out;
    ASSERT_TRUE(decode(wire, out, err)) << err.message();
    EXPECT_TRUE(in == out) << describe(out);
  }
  for (const Packet &in : {Packet{ReadRequest{"./testfile", "octet"}},
                           Packet{WriteRequest{"dir/f.txt", "netascii"}}}) {
    std::vector<uint8_t> wire;
    Error err;
    ASSERT_TRUE(encode(in, wire, err));
    Packet out;
    ASSERT_TRUE(decode(wire, out, err));
    EXPECT_TRUE(in == out);
  }
}

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "shared/plugctl_wire_v1.h"

namespace plugctl {

using Bytes = std::vector<uint8_t>;
using MacAddress = std::array<uint8_t, 6>;

static constexpr size_t kHeaderLen = WIRE_HEADER_LEN;
static constexpr size_t kMaxDatagram = 2048;

// Decoded view of the fixed 0x38-byte header. encode_header() and
// decode_header() are the only places that touch header offsets.
struct FrameHeader {
  uint16_t checksum = 0;
  uint16_t error_code = 0;
  uint16_t device_type = 0;
  uint16_t command = 0;
  uint16_t sequence = 0;
  MacAddress mac{};
  uint32_t device_id = 0;
  uint16_t payload_checksum = 0;
};

static inline uint16_t rd16_le(const uint8_t* p) {
  return (uint16_t)(p[0] | ((uint16_t)p[1] << 8));
}

static inline uint32_t rd32_le(const uint8_t* p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static inline void wr16_le(uint8_t* p, uint16_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
}

static inline void wr32_le(uint8_t* p, uint32_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
  p[2] = (uint8_t)((v >> 16) & 0xFF);
  p[3] = (uint8_t)((v >> 24) & 0xFF);
}

// 16-bit sum seeded with 0xBEAF, wrapping at 16 bits.
uint16_t checksum16(const uint8_t* data, size_t len);

// Zeroes the checksum field, recomputes, compares and restores the stored
// bytes. The buffer is byte-for-byte unchanged on return.
bool verify_checksum(uint8_t* buf, size_t len, size_t checksum_pos);

// Frame-level validation used by the listener: long enough to hold the
// header and the checksum at 0x20 matches.
bool validate_frame(uint8_t* buf, size_t len);

// Writes magic and every header field except the frame checksum.
void encode_header(uint8_t* out, const FrameHeader& h);
bool decode_header(const uint8_t* buf, size_t len, FrameHeader& out);

// Header + already-encrypted payload; the frame checksum is written last.
Bytes build_frame(const FrameHeader& h, const uint8_t* ciphertext, size_t ciphertext_len);

// Command / response tag at 0x26; 0 when the buffer is too short.
uint16_t frame_command(const Bytes& frame);

// Helpers for tests and the fake device: parse "aa:bb:cc:dd:ee:ff".
bool parse_mac(const char* text, MacAddress& out);

} // namespace plugctl

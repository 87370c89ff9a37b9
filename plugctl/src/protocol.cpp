#include "protocol.hpp"
#include <cstdio>
#include <cstring>

namespace plugctl {

static const uint8_t kMagic[PLUGCTL_WIRE_MAGIC_LEN] = PLUGCTL_WIRE_MAGIC;

uint16_t checksum16(const uint8_t* data, size_t len) {
  uint16_t sum = PLUGCTL_CHECKSUM_SEED;
  for (size_t i = 0; i < len; i++) {
    sum = (uint16_t)(sum + data[i]);
  }
  return sum;
}

bool verify_checksum(uint8_t* buf, size_t len, size_t checksum_pos) {
  if (checksum_pos + 2 > len) return false;

  uint8_t saved[2];
  std::memcpy(saved, buf + checksum_pos, 2);
  const uint16_t stored = rd16_le(saved);

  wr16_le(buf + checksum_pos, 0);
  const uint16_t calc = checksum16(buf, len);
  std::memcpy(buf + checksum_pos, saved, 2);

  return calc == stored;
}

bool validate_frame(uint8_t* buf, size_t len) {
  if (len < kHeaderLen) return false;
  return verify_checksum(buf, len, WIRE_OFF_CHECKSUM);
}

void encode_header(uint8_t* out, const FrameHeader& h) {
  std::memset(out, 0, kHeaderLen);
  std::memcpy(out + WIRE_OFF_MAGIC, kMagic, sizeof(kMagic));
  wr16_le(out + WIRE_OFF_ERROR, h.error_code);
  wr16_le(out + WIRE_OFF_DEVICE_TYPE, h.device_type);
  wr16_le(out + WIRE_OFF_COMMAND, h.command);
  wr16_le(out + WIRE_OFF_SEQUENCE, h.sequence);
  std::memcpy(out + WIRE_OFF_MAC, h.mac.data(), h.mac.size());
  wr32_le(out + WIRE_OFF_DEVICE_ID, h.device_id);
  wr16_le(out + WIRE_OFF_PAYLOAD_CHECKSUM, h.payload_checksum);
}

bool decode_header(const uint8_t* buf, size_t len, FrameHeader& out) {
  if (len < kHeaderLen) return false;
  out.checksum = rd16_le(buf + WIRE_OFF_CHECKSUM);
  out.error_code = rd16_le(buf + WIRE_OFF_ERROR);
  out.device_type = rd16_le(buf + WIRE_OFF_DEVICE_TYPE);
  out.command = rd16_le(buf + WIRE_OFF_COMMAND);
  out.sequence = rd16_le(buf + WIRE_OFF_SEQUENCE);
  std::memcpy(out.mac.data(), buf + WIRE_OFF_MAC, out.mac.size());
  out.device_id = rd32_le(buf + WIRE_OFF_DEVICE_ID);
  out.payload_checksum = rd16_le(buf + WIRE_OFF_PAYLOAD_CHECKSUM);
  return true;
}

Bytes build_frame(const FrameHeader& h, const uint8_t* ciphertext, size_t ciphertext_len) {
  Bytes frame(kHeaderLen + ciphertext_len, 0);
  encode_header(frame.data(), h);
  if (ciphertext_len && ciphertext) {
    std::memcpy(frame.data() + kHeaderLen, ciphertext, ciphertext_len);
  }

  const uint16_t sum = checksum16(frame.data(), frame.size());
  wr16_le(frame.data() + WIRE_OFF_CHECKSUM, sum);
  return frame;
}

uint16_t frame_command(const Bytes& frame) {
  if (frame.size() < WIRE_OFF_COMMAND + 2) return 0;
  return rd16_le(frame.data() + WIRE_OFF_COMMAND);
}

bool parse_mac(const char* text, MacAddress& out) {
  if (!text) return false;
  unsigned int ma[6] = {0};
  char tail = 0;
  if (std::sscanf(text, "%x:%x:%x:%x:%x:%x%c",
                  &ma[0], &ma[1], &ma[2], &ma[3], &ma[4], &ma[5], &tail) != 6) {
    return false;
  }
  for (int i = 0; i < 6; ++i) {
    if (ma[i] > 0xFF) return false;
    out[i] = (uint8_t)ma[i];
  }
  return true;
}

} // namespace plugctl

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "protocol.hpp"
#include "session_cipher.hpp"

namespace plugctl {

// Plaintext payloads carried inside the 0x6a envelope (and the 0x65 auth
// request). Every field sits at a fixed offset; the builders and parsers
// below are the only code that knows them.

static constexpr size_t kCommandPayloadLen = 16;
using CommandPayload = std::array<uint8_t, kCommandPayloadLen>;

// ---- single relay -------------------------------------------------------

enum : uint8_t {
  SP_SUBCMD_QUERY = 0x01,
  SP_SUBCMD_SET   = 0x02,
};

enum : size_t {
  SP_OFF_SUBCMD = 0x00,
  SP_OFF_STATE  = 0x04,  // request: 1 = on; reply: status byte
};

CommandPayload build_sp_set_power(bool on);
CommandPayload build_sp_query_power();
// Status 0x01, 0x03 and 0xfd read as on.
bool parse_sp_power_state(const Bytes& plain, bool& on);

// ---- multi relay --------------------------------------------------------

static constexpr uint8_t kMpControlBias = 0xb2;
static constexpr int kMpMaxRelays = 8;

enum : size_t {
  MP_OFF_CONTROL = 0x06,
  MP_OFF_MASK    = 0x0d,
  MP_OFF_ENABLED = 0x0e,
  MP_OFF_STATUS  = 0x0e,  // reply: relay bitmask
};

// ((on ? mask << 1 : mask) + 0xb2) mod 256
uint8_t mp_control_byte(uint8_t mask, bool on);
CommandPayload build_mp_set_mask(uint8_t mask, bool on);
// 1-based relay index to a single-bit mask; false outside 1..8.
bool mp_mask_for_index(int index, uint8_t& mask);
CommandPayload build_mp_query();
bool parse_mp_status(const Bytes& plain, uint8_t& mask);

// ---- authentication -----------------------------------------------------

struct AuthReply {
  uint32_t device_id = 0;
  AesKey key{};
};

// Host name is truncated or zero padded to the reserved field.
Bytes build_auth_request(const std::string& host_name);
bool parse_auth_reply(const Bytes& plain, AuthReply& out);

} // namespace plugctl

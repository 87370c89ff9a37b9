#pragma once
// ============================================================
// SWITCH APPLIANCE UDP WIRE CONTRACT
// v1.0
//
// Single source of truth for the frame layout, command tags and
// vendor defaults spoken by the plug / strip firmware.
//
// RULES:
//  - All multi-byte header fields are little-endian.
//  - Offsets are relative to the start of the datagram.
//  - Defaults below are the vendor's published values; they must
//    match bit-for-bit or nothing talks to a factory device.
// ============================================================

#define PLUGCTL_DEFAULT_PORT 80

// ------------------------------------------------------------
// Frame header offsets
// ------------------------------------------------------------
typedef enum {
  WIRE_OFF_MAGIC            = 0x00,  // 8 bytes
  WIRE_OFF_CHECKSUM         = 0x20,  // u16, frame checksum
  WIRE_OFF_ERROR            = 0x22,  // u16, reply error code
  WIRE_OFF_DEVICE_TYPE      = 0x24,  // u16
  WIRE_OFF_COMMAND          = 0x26,  // u16, command / response tag
  WIRE_OFF_SEQUENCE         = 0x28,  // u16
  WIRE_OFF_MAC              = 0x2a,  // 6 bytes
  WIRE_OFF_DEVICE_ID        = 0x30,  // u32
  WIRE_OFF_PAYLOAD_CHECKSUM = 0x34,  // u16, over padded plaintext
  WIRE_HEADER_LEN           = 0x38
} plugctl_wire_offset_t;

#define PLUGCTL_WIRE_MAGIC { 0x5a, 0xa5, 0xaa, 0x55, 0x5a, 0xa5, 0xaa, 0x55 }
#define PLUGCTL_WIRE_MAGIC_LEN 8

#define PLUGCTL_CHECKSUM_SEED 0xbeaf

// ------------------------------------------------------------
// Command tags (client -> device)
// ------------------------------------------------------------
typedef enum {
  WIRE_CMD_AUTH    = 0x0065,
  WIRE_CMD_COMMAND = 0x006a   // family command envelope
} plugctl_wire_cmd_t;

// ------------------------------------------------------------
// Response tags (device -> client)
// ------------------------------------------------------------
typedef enum {
  WIRE_RESP_AUTH = 0x03e9
} plugctl_wire_resp_t;

// ------------------------------------------------------------
// Session cipher defaults (AES-128-CBC)
// ------------------------------------------------------------
#define PLUGCTL_DEFAULT_KEY { 0x09, 0x76, 0x28, 0x34, 0x3f, 0xe9, 0x9e, 0x23, \
                              0x76, 0x5c, 0x15, 0x13, 0xac, 0xcf, 0x8b, 0x02 }
#define PLUGCTL_DEFAULT_IV  { 0x56, 0x2e, 0x17, 0x99, 0x6d, 0x09, 0x3d, 0x28, \
                              0xdd, 0xb3, 0xba, 0x69, 0x5a, 0x2e, 0x6f, 0x58 }

// ------------------------------------------------------------
// Authentication payload layout
// ------------------------------------------------------------
typedef enum {
  WIRE_AUTH_REQ_LEN        = 0x50,
  WIRE_AUTH_REQ_OFF_FLAG   = 0x2d,   // set to 0x01
  WIRE_AUTH_REQ_OFF_HOST   = 0x30,
  WIRE_AUTH_REQ_HOST_LEN   = 0x20,
  WIRE_AUTH_RESP_OFF_ID    = 0x00,   // u32
  WIRE_AUTH_RESP_OFF_KEY   = 0x04,   // 16 bytes
  WIRE_AUTH_RESP_MIN_LEN   = 0x14
} plugctl_wire_auth_t;

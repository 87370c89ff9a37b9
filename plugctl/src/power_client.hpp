#pragma once
#include <cstdint>

#include "config.hpp"
#include "device_family.hpp"
#include "device_session.hpp"
#include "error.hpp"
#include "payloads.hpp"

namespace plugctl {

// Family-dispatched command set for one plug or strip. Operations a family
// does not offer fail with ErrorKind::NOT_SUPPORTED without touching the wire.
class PowerClient {
public:
  PowerClient() = default;

  bool open(const ClientConfig& cfg);
  void close();

  bool authenticate(uint32_t& device_id);

  // Single relay
  bool set_power(bool on);
  bool query_power(bool& on);

  // Multi relay
  bool set_power_mask(uint8_t mask, bool on);
  bool set_power_by_index(int index, bool on);
  bool query_power_raw(uint8_t& mask);

  DeviceFamily family() const { return m_family; }
  const Error& last_error() const { return m_last_error; }

private:
  bool require(DeviceFamily family, const char* op);
  bool exchange(const CommandPayload& payload, Bytes& reply);
  bool query(const CommandPayload& payload, Bytes& plain);
  bool session_failed();

  DeviceSession m_session;
  DeviceFamily m_family = DeviceFamily::UNKNOWN;
  Error m_last_error;
};

} // namespace plugctl

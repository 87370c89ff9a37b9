#pragma once
#include <cstdint>

namespace plugctl {

enum class DeviceFamily : uint8_t {
  UNKNOWN = 0,   // base behaviour: every power operation is unsupported
  SINGLE_RELAY,  // SP2 / SP3 / SPMini plugs
  MULTI_RELAY,   // MP1 strips
};

DeviceFamily family_for_model(uint16_t model_code);
const char* family_name(DeviceFamily family);

} // namespace plugctl

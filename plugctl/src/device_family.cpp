#include "device_family.hpp"

namespace plugctl {

DeviceFamily family_for_model(uint16_t model_code) {
  switch (model_code) {
    case 0x2711:                                  // SP2
    case 0x2719: case 0x7919: case 0x271a: case 0x791a:  // Honeywell SP2
    case 0x2720:                                  // SPMini
    case 0x753e:                                  // SP3
    case 0x7d00:                                  // OEM SP3
    case 0x947a: case 0x9479:                     // SP3S
    case 0x2728:                                  // SPMini2
    case 0x2733: case 0x273e:                     // OEM SPMini
    case 0x7530: case 0x7546: case 0x7918:        // OEM SPMini2
    case 0x7d0d:                                  // OEM SPMini3
    case 0x2736:                                  // SPMiniPlus
      return DeviceFamily::SINGLE_RELAY;
    case 0x4eb5:
    case 0x4ef7:
      return DeviceFamily::MULTI_RELAY;
    default:
      return DeviceFamily::UNKNOWN;
  }
}

const char* family_name(DeviceFamily family) {
  switch (family) {
    case DeviceFamily::SINGLE_RELAY: return "single-relay";
    case DeviceFamily::MULTI_RELAY: return "multi-relay";
    case DeviceFamily::UNKNOWN: break;
  }
  return "unknown";
}

} // namespace plugctl

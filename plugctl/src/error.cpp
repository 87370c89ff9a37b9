#include "error.hpp"

namespace plugctl {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE: return "ok";
    case ErrorKind::TRANSPORT: return "transport";
    case ErrorKind::TIMEOUT: return "timeout";
    case ErrorKind::PROTOCOL: return "protocol";
    case ErrorKind::NOT_SUPPORTED: return "not supported";
    case ErrorKind::MALFORMED: return "malformed";
  }
  return "unknown";
}

} // namespace plugctl

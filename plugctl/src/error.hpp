#pragma once
#include <cstdint>
#include <string>

namespace plugctl {

enum class ErrorKind : uint8_t {
  NONE = 0,
  TRANSPORT,      // socket unavailable, bad address, send failure, closed
  TIMEOUT,        // no (matching) frame before the deadline
  PROTOCOL,       // device replied with a nonzero error code
  NOT_SUPPORTED,  // operation not offered by this device family
  MALFORMED,      // short reply, bad ciphertext length, bad argument
};

struct Error {
  ErrorKind kind = ErrorKind::NONE;
  uint16_t code = 0;  // device error code for PROTOCOL
  std::string message;

  bool ok() const { return kind == ErrorKind::NONE; }
};

const char* error_kind_name(ErrorKind kind);

} // namespace plugctl

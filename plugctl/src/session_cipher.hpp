#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "protocol.hpp"

namespace plugctl {

static constexpr size_t kBlockLen = 16;
using AesKey = std::array<uint8_t, kBlockLen>;
using AesIv = std::array<uint8_t, kBlockLen>;

const AesKey& default_key();
const AesIv& default_iv();

// How decrypt() treats the tail of the plaintext. Devices pad with zeros,
// which TRAILING_LENGTH cannot decode; replies are read with NONE. Which
// convention the firmware really expects is still unconfirmed on hardware.
enum class Unpad : uint8_t {
  NONE,
  TRAILING_LENGTH,  // strip N bytes, N = value of the last byte
};

// Zero bytes up to the next block boundary. Aligned input gains a whole block.
Bytes pad_zero(const uint8_t* data, size_t len);

// No-op when the last byte is 0 or larger than the buffer.
void unpad_trailing_length(Bytes& data);

// AES-128-CBC with a replaceable key and a fixed IV.
class SessionCipher {
public:
  SessionCipher();
  SessionCipher(const AesKey& key, const AesIv& iv);

  // pad_zero() then CBC.
  bool encrypt(const uint8_t* plain, size_t len, Bytes& out) const;
  // Input must already be a nonzero multiple of the block size.
  bool encrypt_padded(const uint8_t* plain, size_t len, Bytes& out) const;
  // Fails on empty or non block-aligned input.
  bool decrypt(const uint8_t* cipher, size_t len, Bytes& out, Unpad mode = Unpad::NONE) const;

  void set_key(const AesKey& key) { m_key = key; }
  const AesKey& key() const { return m_key; }
  const AesIv& iv() const { return m_iv; }

private:
  AesKey m_key;
  AesIv m_iv;
};

} // namespace plugctl

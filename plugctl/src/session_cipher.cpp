#include "session_cipher.hpp"
#include "log.hpp"
#include <openssl/evp.h>
#include <cstring>

namespace plugctl {

static const AesKey kDefaultKey = PLUGCTL_DEFAULT_KEY;
static const AesIv kDefaultIv = PLUGCTL_DEFAULT_IV;

const AesKey& default_key() { return kDefaultKey; }
const AesIv& default_iv() { return kDefaultIv; }

Bytes pad_zero(const uint8_t* data, size_t len) {
  const size_t fill = kBlockLen - (len % kBlockLen);
  Bytes out(len + fill, 0);
  if (len) std::memcpy(out.data(), data, len);
  return out;
}

void unpad_trailing_length(Bytes& data) {
  if (data.empty()) return;
  const size_t n = data.back();
  if (n == 0 || n > data.size()) return;
  data.resize(data.size() - n);
}

// Single CBC pass with padding disabled; len must be block aligned.
static bool aes128_cbc(bool encrypt, const AesKey& key, const AesIv& iv,
                       const uint8_t* in, size_t len, Bytes& out) {
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    log_msg(PLUGCTL_LOG_ERROR, "cipher", "EVP_CIPHER_CTX_new failed");
    return false;
  }

  bool ok = false;
  out.assign(len + kBlockLen, 0);
  if (EVP_CipherInit_ex(ctx, EVP_aes_128_cbc(), nullptr, key.data(), iv.data(), encrypt ? 1 : 0)) {
    EVP_CIPHER_CTX_set_padding(ctx, 0);
    int outlen = 0;
    int finlen = 0;
    if (EVP_CipherUpdate(ctx, out.data(), &outlen, in, (int)len)) {
      if (EVP_CipherFinal_ex(ctx, out.data() + outlen, &finlen)) {
        out.resize((size_t)(outlen + finlen));
        ok = true;
      } else {
        log_msg(PLUGCTL_LOG_ERROR, "cipher", "EVP_CipherFinal_ex failed");
      }
    } else {
      log_msg(PLUGCTL_LOG_ERROR, "cipher", "EVP_CipherUpdate failed");
    }
  } else {
    log_msg(PLUGCTL_LOG_ERROR, "cipher", "EVP_CipherInit_ex failed");
  }
  EVP_CIPHER_CTX_free(ctx);
  if (!ok) out.clear();
  return ok;
}

SessionCipher::SessionCipher() : m_key(kDefaultKey), m_iv(kDefaultIv) {}

SessionCipher::SessionCipher(const AesKey& key, const AesIv& iv) : m_key(key), m_iv(iv) {}

bool SessionCipher::encrypt(const uint8_t* plain, size_t len, Bytes& out) const {
  const Bytes padded = pad_zero(plain, len);
  return aes128_cbc(true, m_key, m_iv, padded.data(), padded.size(), out);
}

bool SessionCipher::encrypt_padded(const uint8_t* plain, size_t len, Bytes& out) const {
  if (len == 0 || len % kBlockLen != 0) return false;
  return aes128_cbc(true, m_key, m_iv, plain, len, out);
}

bool SessionCipher::decrypt(const uint8_t* cipher, size_t len, Bytes& out, Unpad mode) const {
  if (len < kBlockLen || len % kBlockLen != 0) return false;
  if (!aes128_cbc(false, m_key, m_iv, cipher, len, out)) return false;
  if (mode == Unpad::TRAILING_LENGTH) unpad_trailing_length(out);
  return true;
}

} // namespace plugctl

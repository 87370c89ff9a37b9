#include "session_cipher.hpp"

#include <cassert>
#include <cstring>

using namespace plugctl;

// NIST SP 800-38A, F.2.1 CBC-AES128.Encrypt
static const AesKey kNistKey = {0x2b, 0x7e, 0x15, 0x16, 0x28, 0xae, 0xd2, 0xa6,
                                0xab, 0xf7, 0x15, 0x88, 0x09, 0xcf, 0x4f, 0x3c};
static const AesIv kNistIv = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                              0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f};
static const uint8_t kNistPlain[32] = {
    0x6b, 0xc1, 0xbe, 0xe2, 0x2e, 0x40, 0x9f, 0x96, 0xe9, 0x3d, 0x7e, 0x11, 0x73, 0x93, 0x17, 0x2a,
    0xae, 0x2d, 0x8a, 0x57, 0x1e, 0x03, 0xac, 0x9c, 0x9e, 0xb7, 0x6f, 0xac, 0x45, 0xaf, 0x8e, 0x51};
static const uint8_t kNistCipher[32] = {
    0x76, 0x49, 0xab, 0xac, 0x81, 0x19, 0xb2, 0x46, 0xce, 0xe9, 0x8e, 0x9b, 0x12, 0xe9, 0x19, 0x7d,
    0x50, 0x86, 0xcb, 0x9b, 0x50, 0x72, 0x19, 0xee, 0x95, 0xdb, 0x11, 0x3a, 0x91, 0x76, 0x78, 0xb2};

int main() {
    // Vendor defaults, bit for bit.
    const AesKey expect_key = {0x09, 0x76, 0x28, 0x34, 0x3f, 0xe9, 0x9e, 0x23,
                               0x76, 0x5c, 0x15, 0x13, 0xac, 0xcf, 0x8b, 0x02};
    const AesIv expect_iv = {0x56, 0x2e, 0x17, 0x99, 0x6d, 0x09, 0x3d, 0x28,
                             0xdd, 0xb3, 0xba, 0x69, 0x5a, 0x2e, 0x6f, 0x58};
    assert(default_key() == expect_key);
    assert(default_iv() == expect_iv);
    SessionCipher fresh;
    assert(fresh.key() == expect_key);
    assert(fresh.iv() == expect_iv);

    // Zero padding: up to the boundary, a whole extra block when aligned.
    const uint8_t five[5] = {1, 2, 3, 4, 5};
    Bytes p = pad_zero(five, sizeof(five));
    assert(p.size() == 16);
    assert(std::memcmp(p.data(), five, 5) == 0);
    for (size_t i = 5; i < 16; ++i) assert(p[i] == 0);
    assert(pad_zero(kNistPlain, 16).size() == 32);
    assert(pad_zero(nullptr, 0).size() == 16);

    // Known answer on the aligned path.
    SessionCipher nist(kNistKey, kNistIv);
    Bytes ct;
    bool ok = nist.encrypt_padded(kNistPlain, sizeof(kNistPlain), ct);
    (void)ok;
    assert(ok);
    assert(ct.size() == 32);
    assert(std::memcmp(ct.data(), kNistCipher, 32) == 0);

    // encrypt() pads first: the known blocks come out unchanged, plus one block.
    Bytes ct_padded;
    assert(nist.encrypt(kNistPlain, sizeof(kNistPlain), ct_padded));
    assert(ct_padded.size() == 48);
    assert(std::memcmp(ct_padded.data(), kNistCipher, 32) == 0);

    // decrypt(encrypt(P)) == pad(P)
    const char* text = "switch me on";
    const size_t text_len = std::strlen(text);
    Bytes round_ct;
    assert(fresh.encrypt(reinterpret_cast<const uint8_t*>(text), text_len, round_ct));
    Bytes round_pt;
    assert(fresh.decrypt(round_ct.data(), round_ct.size(), round_pt));
    assert(round_pt == pad_zero(reinterpret_cast<const uint8_t*>(text), text_len));

    Bytes nist_pt;
    assert(nist.decrypt(kNistCipher, sizeof(kNistCipher), nist_pt));
    assert(nist_pt.size() == 32);
    assert(std::memcmp(nist_pt.data(), kNistPlain, 32) == 0);

    // Ciphertext must be whole blocks.
    Bytes junk;
    assert(!fresh.decrypt(kNistCipher, 15, junk));
    assert(!fresh.decrypt(kNistCipher, 17, junk));
    assert(!fresh.decrypt(kNistCipher, 0, junk));
    assert(!fresh.encrypt_padded(kNistPlain, 0, junk));
    assert(!fresh.encrypt_padded(kNistPlain, 20, junk));

    // Trailing-length unpad strips by the value of the last byte ...
    Bytes tagged(16, 0xaa);
    tagged[15] = 4;
    Bytes tagged_ct;
    assert(fresh.encrypt_padded(tagged.data(), tagged.size(), tagged_ct));
    Bytes stripped;
    assert(fresh.decrypt(tagged_ct.data(), tagged_ct.size(), stripped, Unpad::TRAILING_LENGTH));
    assert(stripped.size() == 12);
    // ... and cannot undo zero padding, which is left alone.
    Bytes zero_tail;
    assert(fresh.decrypt(round_ct.data(), round_ct.size(), zero_tail, Unpad::TRAILING_LENGTH));
    assert(zero_tail.size() == 16);

    Bytes oversize(4, 0);
    oversize[3] = 9;
    unpad_trailing_length(oversize);
    assert(oversize.size() == 4);

    // A replaced key changes the ciphertext.
    SessionCipher rotated;
    rotated.set_key(kNistKey);
    Bytes rotated_ct;
    assert(rotated.encrypt(reinterpret_cast<const uint8_t*>(text), text_len, rotated_ct));
    assert(rotated_ct != round_ct);

    return 0;
}

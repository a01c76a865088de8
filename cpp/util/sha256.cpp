#include "util/sha256.hpp"

#include <kj/debug.h>
#include <cstring>

#define SHA2_SHFR(x, n) ((x) >> (n))
#define SHA2_ROTR(x, n) (((x) >> (n)) | ((x) << ((sizeof(x) << 3) - (n))))
#define SHA2_CH(x, y, z) (((x) & (y)) ^ (~(x) & (z)))
#define SHA2_MAJ(x, y, z) (((x) & (y)) ^ ((x) & (z)) ^ ((y) & (z)))
#define SHA256_F1(x) (SHA2_ROTR(x, 2) ^ SHA2_ROTR(x, 13) ^ SHA2_ROTR(x, 22))
#define SHA256_F2(x) (SHA2_ROTR(x, 6) ^ SHA2_ROTR(x, 11) ^ SHA2_ROTR(x, 25))
#define SHA256_F3(x) (SHA2_ROTR(x, 7) ^ SHA2_ROTR(x, 18) ^ SHA2_SHFR(x, 3))
#define SHA256_F4(x) (SHA2_ROTR(x, 17) ^ SHA2_ROTR(x, 19) ^ SHA2_SHFR(x, 10))

namespace {

const uint32_t sha256_k[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

inline uint32_t Pack32(const unsigned char* str) {
  return (static_cast<uint32_t>(str[3])) |
         (static_cast<uint32_t>(str[2]) << 8) |
         (static_cast<uint32_t>(str[1]) << 16) |
         (static_cast<uint32_t>(str[0]) << 24);
}

inline void Unpack32(uint32_t x, unsigned char* str) {
  str[3] = static_cast<unsigned char>(x);
  str[2] = static_cast<unsigned char>(x >> 8);
  str[1] = static_cast<unsigned char>(x >> 16);
  str[0] = static_cast<unsigned char>(x >> 24);
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

namespace util {

const SHA256_t SHA256_t::ZERO = SHA256_t(std::array<uint8_t, DIGEST_SIZE>{});

SHA256_t::SHA256_t(const std::string& hash) : hash_{} {
  KJ_REQUIRE(hash.size() == 2 * DIGEST_SIZE, hash, "Invalid hex digest");
  for (uint32_t i = 0; i < DIGEST_SIZE; i++) {
    int hi = HexValue(hash[2 * i]);
    int lo = HexValue(hash[2 * i + 1]);
    KJ_REQUIRE(hi >= 0 && lo >= 0, hash, "Invalid hex digest");
    hash_[i] = static_cast<uint8_t>(hi << 4 | lo);
  }
}

SHA256_t::SHA256_t(kj::ArrayPtr<const kj::byte> bytes) : hash_{} {
  KJ_REQUIRE(bytes.size() == DIGEST_SIZE, bytes.size(), "Invalid digest size");
  std::memcpy(hash_.data(), bytes.begin(), DIGEST_SIZE);
}

std::string SHA256_t::Hex() const {
  static const constexpr char* digits = "0123456789abcdef";
  std::string res(2 * DIGEST_SIZE, '0');
  for (uint32_t i = 0; i < DIGEST_SIZE; i++) {
    res[2 * i] = digits[hash_[i] >> 4];
    res[2 * i + 1] = digits[hash_[i] & 0xf];
  }
  return res;
}

void SHA256::init() {
  m_h[0] = 0x6a09e667;
  m_h[1] = 0xbb67ae85;
  m_h[2] = 0x3c6ef372;
  m_h[3] = 0xa54ff53a;
  m_h[4] = 0x510e527f;
  m_h[5] = 0x9b05688c;
  m_h[6] = 0x1f83d9ab;
  m_h[7] = 0x5be0cd19;
  m_len = 0;
  m_tot_len = 0;
}

void SHA256::transform(const unsigned char* message, size_t block_nb) {
  uint32_t w[64];
  uint32_t wv[8];
  for (size_t i = 0; i < block_nb; i++) {
    const unsigned char* sub_block = message + (i << 6);
    for (int j = 0; j < 16; j++) w[j] = Pack32(&sub_block[j << 2]);
    for (int j = 16; j < 64; j++) {
      w[j] = SHA256_F4(w[j - 2]) + w[j - 7] + SHA256_F3(w[j - 15]) + w[j - 16];
    }
    for (int j = 0; j < 8; j++) wv[j] = m_h[j];
    for (int j = 0; j < 64; j++) {
      uint32_t t1 = wv[7] + SHA256_F2(wv[4]) + SHA2_CH(wv[4], wv[5], wv[6]) +
                    sha256_k[j] + w[j];
      uint32_t t2 = SHA256_F1(wv[0]) + SHA2_MAJ(wv[0], wv[1], wv[2]);
      wv[7] = wv[6];
      wv[6] = wv[5];
      wv[5] = wv[4];
      wv[4] = wv[3] + t1;
      wv[3] = wv[2];
      wv[2] = wv[1];
      wv[1] = wv[0];
      wv[0] = t1 + t2;
    }
    for (int j = 0; j < 8; j++) m_h[j] += wv[j];
  }
}

void SHA256::update(const unsigned char* message, size_t len) {
  size_t tmp_len = SHA224_256_BLOCK_SIZE - m_len;
  size_t rem_len = len < tmp_len ? len : tmp_len;
  if (rem_len > 0) std::memcpy(&m_block[m_len], message, rem_len);
  if (m_len + len < SHA224_256_BLOCK_SIZE) {
    m_len += len;
    return;
  }
  size_t new_len = len - rem_len;
  size_t block_nb = new_len / SHA224_256_BLOCK_SIZE;
  const unsigned char* shifted_message = message + rem_len;
  transform(m_block, 1);
  transform(shifted_message, block_nb);
  rem_len = new_len % SHA224_256_BLOCK_SIZE;
  if (rem_len > 0) {
    std::memcpy(m_block, &shifted_message[block_nb << 6], rem_len);
  }
  m_len = rem_len;
  m_tot_len += (block_nb + 1) << 6;
}

void SHA256::finalize(unsigned char* digest) {
  // Room for the 0x80 marker and the 64 bit length, or a second block.
  size_t block_nb = 1 + ((SHA224_256_BLOCK_SIZE - 9) <
                         (m_len % SHA224_256_BLOCK_SIZE));
  uint64_t len_b = (m_tot_len + m_len) << 3;
  size_t pm_len = block_nb << 6;
  std::memset(m_block + m_len, 0, pm_len - m_len);
  m_block[m_len] = 0x80;
  Unpack32(static_cast<uint32_t>(len_b >> 32), m_block + pm_len - 8);
  Unpack32(static_cast<uint32_t>(len_b), m_block + pm_len - 4);
  transform(m_block, block_nb);
  for (int i = 0; i < 8; i++) Unpack32(m_h[i], &digest[i << 2]);
}

SHA256_t SHA256::finalize() {
  std::array<uint8_t, DIGEST_SIZE> digest{};
  finalize(digest.data());
  return SHA256_t(digest);
}

}  // namespace util

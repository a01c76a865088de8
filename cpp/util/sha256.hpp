#ifndef UTIL_SHA256_HPP
#define UTIL_SHA256_HPP

#include <kj/array.h>
#include <kj/common.h>
#include <array>
#include <cstdint>
#include <string>

namespace util {
static const constexpr uint32_t DIGEST_SIZE = (256 / 8);

// Represents a SHA256 digest of some sequence of bytes.
class SHA256_t {
  std::array<uint8_t, DIGEST_SIZE> hash_;

 public:
  // Construct from an array of bytes representing the hash.
  explicit SHA256_t(const std::array<uint8_t, DIGEST_SIZE>& hash)
      : hash_(hash) {}

  // Construct from / convert to a hex string. Throws if the string is not a
  // valid 64 characters hex digest.
  explicit SHA256_t(const std::string& hash);
  std::string Hex() const;

  // Construct from / view as raw bytes. bytes must be DIGEST_SIZE long.
  explicit SHA256_t(kj::ArrayPtr<const kj::byte> bytes);
  kj::ArrayPtr<const kj::byte> Bytes() const {
    return kj::arrayPtr(hash_.data(), hash_.size());
  }

  // True if the hash is all zeros, used as "unknown".
  bool isZero() const {
    for (uint32_t i = 0; i < DIGEST_SIZE; i++) {
      if (hash_[i]) return false;
    }
    return true;
  }

  // Hashing implementation.
  friend class Hasher;
  struct Hasher {
    uint64_t operator()(const SHA256_t& h) const {
      uint64_t hash = 0;
      for (size_t i = 0; i < sizeof(uint64_t); i++) {
        hash <<= 8;
        hash |= h.hash_[i];
      }
      return hash;
    };
  };

  bool operator==(const SHA256_t& other) const { return hash_ == other.hash_; }
  bool operator!=(const SHA256_t& other) const { return hash_ != other.hash_; }

  static const SHA256_t ZERO;
};

// SHA256 hasher.
class SHA256 {
 public:
  SHA256() : m_block{}, m_h{} { init(); }

  // (Re)initializes the hasher.
  void init();

  // Updates the hasher with a chunk of data.
  void update(const unsigned char* message, size_t len);
  void update(kj::ArrayPtr<const kj::byte> data) {
    update(data.begin(), data.size());
  }
  void update(const std::string& data) {
    // NOLINTNEXTLINE
    update(reinterpret_cast<const unsigned char*>(data.data()), data.size());
  }

  // Finalizes the hasher, writing the hash to digest or returning it.
  void finalize(unsigned char* digest);
  SHA256_t finalize();

  KJ_DISALLOW_COPY(SHA256);
  ~SHA256() = default;
  SHA256(SHA256&&) = default;
  SHA256& operator=(SHA256&&) = default;

 private:
  static const constexpr uint32_t SHA224_256_BLOCK_SIZE = (512 / 8);
  void transform(const unsigned char* message, size_t block_nb);
  uint64_t m_tot_len{0};
  size_t m_len{0};
  unsigned char m_block[2 * SHA224_256_BLOCK_SIZE];
  uint32_t m_h[8];
};

}  // namespace util
#endif

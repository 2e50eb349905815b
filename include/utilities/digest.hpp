#ifndef CHUNKVAULT_DIGEST_HPP
#define CHUNKVAULT_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sodium.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::utils {

/// SHA-256 digest size (32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Initialise libsodium once for the process.
 * @throw std::runtime_error If libsodium cannot be initialised.
 */
void ensureSodium();

/**
 * @brief Incremental SHA-256 over a byte stream.
 *
 * Used by the merge path to digest an artifact while it is being written.
 */
class Sha256Stream {
public:
  Sha256Stream();

  void update(std::span<const std::byte> data);

  /// Finish the digest. The stream must not be updated afterwards.
  DigestArray finish();

private:
  crypto_hash_sha256_state state_;
  bool finished_ = false;
};

DigestArray sha256(std::span<const std::byte> data);

/// Lowercase hex encoding.
std::string toHex(const uint8_t *data, size_t size);
std::string toHex(const DigestArray &digest);
std::string toHex(std::string_view raw);

/// Decode hex (either case). Returns nullopt on malformed input.
std::optional<std::vector<uint8_t>> fromHex(std::string_view hex);

/// `bytes` bytes of libsodium randomness rendered as hex.
std::string randomHex(size_t bytes);

} // namespace chunkvault::utils

#endif // CHUNKVAULT_DIGEST_HPP

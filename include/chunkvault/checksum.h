#ifndef CHUNKVAULT_CHECKSUM_H
#define CHUNKVAULT_CHECKSUM_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace chunkvault {

/// SHA-256 gate applied to every chunk before it touches storage or quota.
class ChecksumVerifier {
public:
  /// Lowercase hex SHA-256 of @p bytes.
  static std::string compute(std::span<const std::byte> bytes);

  /**
   * @brief True when @p declaredDigest is the hex SHA-256 of @p bytes.
   *
   * Hex comparison is case-insensitive. Anything that is not exactly 64 hex
   * digits never matches.
   */
  static bool verify(std::span<const std::byte> bytes,
                     std::string_view declaredDigest);
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHECKSUM_H

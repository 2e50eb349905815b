#include "chunkvault/checksum.h"
#include "utilities/digest.hpp"

#include <cctype>

namespace chunkvault {

std::string ChecksumVerifier::compute(std::span<const std::byte> bytes) {
  return utils::toHex(utils::sha256(bytes));
}

bool ChecksumVerifier::verify(std::span<const std::byte> bytes,
                              std::string_view declaredDigest) {
  if (declaredDigest.size() != utils::DIGEST_SIZE * 2)
    return false;
  const std::string actual = compute(bytes);
  for (std::size_t i = 0; i < actual.size(); ++i) {
    const auto declared = static_cast<unsigned char>(declaredDigest[i]);
    if (!std::isxdigit(declared) ||
        std::tolower(declared) != static_cast<unsigned char>(actual[i]))
      return false;
  }
  return true;
}

} // namespace chunkvault

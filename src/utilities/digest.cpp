#include "utilities/digest.hpp"

#include <mutex>
#include <stdexcept>

namespace chunkvault::utils {

void ensureSodium() {
  static std::once_flag once;
  static bool ok = false;
  std::call_once(once, [] {
    // sodium_init() returns 0 on success and 1 if already initialised.
    ok = sodium_init() >= 0;
  });
  if (!ok) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

Sha256Stream::Sha256Stream() {
  ensureSodium();
  crypto_hash_sha256_init(&state_);
}

void Sha256Stream::update(std::span<const std::byte> data) {
  if (finished_) {
    throw std::logic_error("Cannot update a finished SHA-256 stream.");
  }
  if (!data.empty()) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data.data()),
        data.size());
  }
}

DigestArray Sha256Stream::finish() {
  if (finished_) {
    throw std::logic_error("finish() already called.");
  }
  DigestArray digest{};
  crypto_hash_sha256_final(&state_, digest.data());
  finished_ = true;
  return digest;
}

DigestArray sha256(std::span<const std::byte> data) {
  ensureSodium();
  DigestArray digest{};
  crypto_hash_sha256(digest.data(),
                     reinterpret_cast<const unsigned char *>(data.data()),
                     data.size());
  return digest;
}

std::string toHex(const uint8_t *data, size_t size) {
  std::string hex(size * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), data, size);
  hex.resize(size * 2);
  return hex;
}

std::string toHex(const DigestArray &digest) {
  return toHex(digest.data(), digest.size());
}

std::string toHex(std::string_view raw) {
  return toHex(reinterpret_cast<const uint8_t *>(raw.data()), raw.size());
}

std::optional<std::vector<uint8_t>> fromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out(hex.size() / 2);
  size_t written = 0;
  const char *end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr,
                     &written, &end) != 0 ||
      end != hex.data() + hex.size()) {
    return std::nullopt;
  }
  out.resize(written);
  return out;
}

std::string randomHex(size_t bytes) {
  ensureSodium();
  std::vector<uint8_t> buf(bytes);
  randombytes_buf(buf.data(), buf.size());
  return toHex(buf.data(), buf.size());
}

} // namespace chunkvault::utils

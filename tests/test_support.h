#ifndef CHUNKVAULT_TEST_SUPPORT_H
#define CHUNKVAULT_TEST_SUPPORT_H

#include "chunkvault/checksum.h"
#include "chunkvault/collaborators.h"
#include "utilities/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

namespace chunkvault::testing {

inline std::vector<std::byte> toBytes(const std::string& text) {
    std::vector<std::byte> out;
    out.reserve(text.size());
    for (char c : text) out.push_back(std::byte(c));
    return out;
}

inline std::string digestOf(const std::vector<std::byte>& bytes) {
    return ChecksumVerifier::compute(bytes);
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Unique directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    ScratchDir()
        : path_(std::filesystem::temp_directory_path() / "chunkvault_tests" / utils::randomHex(8)) {
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Ledger with a default ceiling and per-tenant overrides.
class FixedLedger : public QuotaLedger {
public:
    explicit FixedLedger(std::uint64_t defaultLimit = 1ULL << 30) : defaultLimit_(defaultLimit) {}

    void set(const TenantId& tenant, std::uint64_t limit) { limits_[tenant] = limit; }

    std::uint64_t limitFor(const TenantId& tenant) const override {
        auto it = limits_.find(tenant);
        return it == limits_.end() ? defaultLimit_ : it->second;
    }

private:
    std::uint64_t defaultLimit_;
    std::map<TenantId, std::uint64_t> limits_;
};

} // namespace chunkvault::testing

#endif // CHUNKVAULT_TEST_SUPPORT_H

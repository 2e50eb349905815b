#ifndef CHUNKVAULT_ARTIFACT_STORE_H
#define CHUNKVAULT_ARTIFACT_STORE_H

#include "chunkvault/errors.h"
#include "chunkvault/lock_table.h"
#include "chunkvault/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Write handle for a new artifact.
 *
 * Bytes go to a hidden temporary file; commit() renames it over the final
 * name, abort() (or destruction without commit) deletes it, so a failed
 * merge never leaves a partial artifact behind.
 */
class ArtifactSink {
public:
  virtual ~ArtifactSink() = default;

  /// @throw std::runtime_error on write failure.
  virtual void write(std::span<const std::byte> data) = 0;
  /// @throw std::runtime_error if the artifact cannot be published.
  virtual void commit() = 0;
  virtual void abort() noexcept = 0;
};

/**
 * @brief Finished artifacts laid out as `<root>/<hex(tenant)>/<category>/<filename>`.
 */
class ArtifactStore {
public:
  explicit ArtifactStore(std::filesystem::path root);
  virtual ~ArtifactStore() = default;

  ArtifactStore(const ArtifactStore &) = delete;
  ArtifactStore &operator=(const ArtifactStore &) = delete;

  /// @throw std::invalid_argument for names that are not valid labels.
  /// @throw std::runtime_error if the temporary file cannot be created.
  virtual std::unique_ptr<ArtifactSink>
  openForWrite(const TenantId &tenant, const std::string &category,
               const std::string &filename);

  std::optional<ArtifactInfo> stat(const TenantId &tenant,
                                   const std::string &category,
                                   const std::string &filename) const;

  /// @return Bytes freed, or ArtifactNotFound / StorageIO.
  Result<std::uint64_t> remove(const TenantId &tenant,
                               const std::string &category,
                               const std::string &filename);

  std::vector<ArtifactInfo> list(const TenantId &tenant) const;

  std::uint64_t totalBytes(const TenantId &tenant) const;

  std::vector<TenantId> tenants() const;

  /// Delete temporaries left behind by interrupted merges.
  std::size_t removeStaleTemporaries();

  using NameLease = LockTable<std::mutex>::Lease;

  /// Serialises replace/delete of one artifact name.
  NameLease lockFor(const TenantId &tenant, const std::string &category,
                    const std::string &filename);

  std::filesystem::path artifactPath(const TenantId &tenant,
                                     const std::string &category,
                                     const std::string &filename) const;

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
  LockTable<std::mutex> nameLocks_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_ARTIFACT_STORE_H

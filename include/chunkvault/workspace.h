#ifndef CHUNKVAULT_WORKSPACE_H
#define CHUNKVAULT_WORKSPACE_H

#include "chunkvault/lock_table.h"
#include "chunkvault/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief On-disk arena for in-flight uploads.
 *
 * Each (tenant, session) pair owns exactly one flat directory
 * `<root>/<hex(tenant)>_<hex(session)>` holding `session.yaml` and one
 * `chunk-NNNNNNNN` file per stored index. Which indices exist is always
 * answered by listing this directory, never from a cache, so the answer
 * survives restarts and concurrent writers.
 *
 * The workspace also owns the per-session reader/writer locks: chunk writes
 * hold a session lock shared, merge and sweep hold it exclusively.
 */
class Workspace {
public:
  static constexpr const char *kMetadataFile = "session.yaml";
  static constexpr const char *kChunkPrefix = "chunk-";
  /// Marker inside names of in-progress writes.
  static constexpr const char *kPartialMarker = ".partial-";

  struct Entry {
    TenantId tenant;
    std::string sessionId;
    std::filesystem::path dir;
    bool hasMetadata{false};
  };

  explicit Workspace(std::filesystem::path root);

  const std::filesystem::path &root() const { return root_; }

  std::filesystem::path sessionDir(const TenantId &tenant,
                                   const std::string &sessionId) const;
  std::filesystem::path metadataPath(const TenantId &tenant,
                                     const std::string &sessionId) const;
  std::filesystem::path chunkPath(const TenantId &tenant,
                                  const std::string &sessionId,
                                  std::uint32_t index) const;

  /// Sorted indices of committed chunk files. Empty if the session is gone.
  std::vector<std::uint32_t> listChunkIndices(const TenantId &tenant,
                                              const std::string &sessionId) const;

  /// Every decodable session directory, with or without metadata.
  std::vector<Entry> listEntries() const;

  using SessionLease = LockTable<std::shared_mutex>::Lease;

  /// Pins the session's reader/writer lock for the lifetime of the lease.
  SessionLease sessionLock(const TenantId &tenant,
                           const std::string &sessionId);

  /// Holders and waiters of the session's lock.
  std::size_t sessionLockHolders(const TenantId &tenant,
                                 const std::string &sessionId) const;

  static std::string chunkFileName(std::uint32_t index);
  static std::optional<std::uint32_t> parseChunkFileName(const std::string &name);
  static bool isPartialFile(const std::string &name);

private:
  std::filesystem::path root_;
  LockTable<std::shared_mutex> sessionLocks_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_WORKSPACE_H

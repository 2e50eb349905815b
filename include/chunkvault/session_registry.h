#ifndef CHUNKVAULT_SESSION_REGISTRY_H
#define CHUNKVAULT_SESSION_REGISTRY_H

#include "chunkvault/errors.h"
#include "chunkvault/lock_table.h"
#include "chunkvault/types.h"
#include "chunkvault/workspace.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Durable metadata for in-flight uploads.
 *
 * Records live in the session's workspace directory as YAML. Creation is
 * first-chunk-wins: once a record exists its declaration (filename,
 * category, totalChunks) is never rewritten, and a later request declaring
 * something different is rejected with SessionConflict.
 */
class SessionRegistry {
public:
  explicit SessionRegistry(Workspace &workspace);

  /**
   * @brief Create the session record if absent, otherwise validate against it.
   * @param createdAt Creation timestamp recorded for a new session.
   * @return The stored record (new or existing).
   */
  Result<SessionInfo> ensureSession(const TenantId &tenant,
                                    const std::string &sessionId,
                                    const std::string &filename,
                                    const std::string &category,
                                    std::uint32_t totalChunks,
                                    Clock::time_point createdAt = Clock::now());

  /// SessionNotFound when absent, Unauthorized when the record's owner is
  /// not @p tenant, StorageIO when the record cannot be read.
  Result<SessionInfo> describe(const TenantId &tenant,
                               const std::string &sessionId) const;

  /// Indices present on disk for the session, ascending.
  std::vector<std::uint32_t>
  listReceivedIndices(const TenantId &tenant,
                      const std::string &sessionId) const;

  /**
   * @brief Remove the session record and its workspace directory.
   *
   * The metadata file goes first so that a partially removed directory is
   * already an orphan. Removing an absent session succeeds.
   */
  Status retire(const TenantId &tenant, const std::string &sessionId);

  /// Every readable session record across all tenants.
  std::vector<SessionInfo> listSessions() const;

private:
  Status writeRecord(const SessionInfo &info) const;
  Result<SessionInfo> readRecord(const TenantId &tenant,
                                 const std::string &sessionId) const;

  Workspace &workspace_;
  LockTable<std::mutex> createLocks_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_SESSION_REGISTRY_H

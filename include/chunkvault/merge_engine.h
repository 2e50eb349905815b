#ifndef CHUNKVAULT_MERGE_ENGINE_H
#define CHUNKVAULT_MERGE_ENGINE_H

#include "chunkvault/artifact_store.h"
#include "chunkvault/cancellation.h"
#include "chunkvault/chunk_store.h"
#include "chunkvault/errors.h"
#include "chunkvault/quota_accountant.h"
#include "chunkvault/session_registry.h"
#include "chunkvault/workspace.h"

#include <string>

namespace chunkvault {

/**
 * @brief Turns a complete session into its artifact.
 *
 * Merge holds the session lock exclusively, so no chunk write can land
 * while chunks are being concatenated, and any write that starts after the
 * session is retired sees SessionNotFound.
 *
 * Quota is not charged again: the chunk bytes were reserved when they were
 * stored and simply become the artifact's bytes. When the merge replaces an
 * existing artifact of the same name, the replaced artifact's bytes are
 * released.
 */
class MergeEngine {
public:
  MergeEngine(Workspace &workspace, SessionRegistry &sessions,
              ChunkStore &chunks, ArtifactStore &artifacts,
              QuotaAccountant &quota);

  /**
   * @return SessionNotFound, IncompleteUpload (with missing indices),
   *         StorageIO (session left intact for a retry), Timeout/Cancelled,
   *         or the new artifact.
   */
  Result<ArtifactInfo> merge(const TenantId &tenant,
                             const std::string &sessionId,
                             const CancellationToken *token = nullptr);

private:
  Workspace &workspace_;
  SessionRegistry &sessions_;
  ChunkStore &chunks_;
  ArtifactStore &artifacts_;
  QuotaAccountant &quota_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_MERGE_ENGINE_H

#ifndef CHUNKVAULT_UPLOAD_SERVICE_H
#define CHUNKVAULT_UPLOAD_SERVICE_H

#include "chunkvault/artifact_store.h"
#include "chunkvault/cancellation.h"
#include "chunkvault/chunk_store.h"
#include "chunkvault/collaborators.h"
#include "chunkvault/config.h"
#include "chunkvault/errors.h"
#include "chunkvault/merge_engine.h"
#include "chunkvault/quota_accountant.h"
#include "chunkvault/retention_sweeper.h"
#include "chunkvault/session_registry.h"
#include "chunkvault/types.h"
#include "chunkvault/workspace.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chunkvault {

/// One chunk as received from the request layer.
struct ChunkUpload {
  std::string sessionId;
  std::uint32_t index{0};
  std::uint32_t totalChunks{0};
  std::string filename;
  std::string category;
  std::span<const std::byte> bytes;
  std::string checksum; ///< Hex SHA-256 of bytes.
};

/**
 * @brief Entry point for the request layer.
 *
 * Resolves the caller's tenant through the IdentityProvider and drives the
 * registry, chunk store, merge engine and sweeper. Every verb returns a
 * Result; storage exceptions never escape.
 */
class UploadService {
public:
  UploadService(Config config, const QuotaLedger &ledger);
  /// Inject a custom artifact store (tests use this for fault injection).
  UploadService(Config config, const QuotaLedger &ledger,
                std::unique_ptr<ArtifactStore> artifacts);
  ~UploadService();

  UploadService(const UploadService &) = delete;
  UploadService &operator=(const UploadService &) = delete;

  /// Creates the session on first use, then stores the chunk.
  Result<ChunkAck> beginOrContinueChunk(const IdentityProvider &identity,
                                        const ChunkUpload &upload,
                                        const CancellationToken *token = nullptr);

  /// A missing session is reported as exists=false, not as an error.
  Result<UploadStatus> status(const IdentityProvider &identity,
                              const std::string &sessionId);

  Result<ArtifactInfo> merge(const IdentityProvider &identity,
                             const std::string &sessionId,
                             const CancellationToken *token = nullptr);

  /// Sweep with the configured retention window.
  std::size_t sweep();
  std::size_t sweep(Clock::time_point now);

  Result<TenantUsage> usage(const IdentityProvider &identity);

  Result<ArtifactInfo> statArtifact(const IdentityProvider &identity,
                                    const std::string &category,
                                    const std::string &filename);

  /// Remove an artifact and release its bytes from the tenant's quota.
  Status deleteArtifact(const IdentityProvider &identity,
                        const std::string &category,
                        const std::string &filename);

  /**
   * @brief Rebuild usedBytes for every tenant from what is on disk.
   *
   * Sums stored chunks of sessions with metadata plus finished artifacts,
   * and removes temporaries left by interrupted writes. Run at startup,
   * before serving requests.
   */
  Status recoverUsage();

  /// 32 hex characters of randomness for clients without their own id.
  static std::string newSessionId();

  const Config &config() const { return config_; }
  RetentionSweeper &sweeper() { return *sweeper_; }

private:
  Result<TenantId> authenticate(const IdentityProvider &identity) const;
  Result<ChunkAck> storeChunk(const IdentityProvider &identity,
                              const ChunkUpload &upload,
                              const CancellationToken *token);
  Result<UploadStatus> describeUpload(const IdentityProvider &identity,
                                      const std::string &sessionId);
  Status prepareDirectories() const;

  Config config_;
  Workspace workspace_;
  QuotaAccountant quota_;
  SessionRegistry sessions_;
  ChunkStore chunks_;
  std::unique_ptr<ArtifactStore> artifacts_;
  MergeEngine merger_;
  std::unique_ptr<RetentionSweeper> sweeper_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_UPLOAD_SERVICE_H

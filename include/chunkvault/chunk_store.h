#ifndef CHUNKVAULT_CHUNK_STORE_H
#define CHUNKVAULT_CHUNK_STORE_H

#include "chunkvault/cancellation.h"
#include "chunkvault/errors.h"
#include "chunkvault/lock_table.h"
#include "chunkvault/quota_accountant.h"
#include "chunkvault/session_registry.h"
#include "chunkvault/workspace.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault {

/**
 * @brief Restartable, ordered walk over a session's chunk payloads.
 *
 * Payloads are read from disk one at a time as the cursor advances.
 */
class ChunkCursor {
public:
  explicit ChunkCursor(std::vector<std::filesystem::path> paths);

  /**
   * @brief Load the next chunk into @p out.
   * @return false once every chunk has been produced; IncompleteUpload if a
   *         chunk disappeared, StorageIO if it could not be read.
   */
  Result<bool> next(std::vector<std::byte> &out);

  /// Start again from index 0.
  void rewind() { position_ = 0; }

  std::size_t position() const { return position_; }
  std::size_t size() const { return paths_.size(); }

private:
  std::vector<std::filesystem::path> paths_;
  std::size_t position_{0};
};

/**
 * @brief Checksum-gated, quota-charged persistence of chunk payloads.
 */
class ChunkStore {
public:
  ChunkStore(Workspace &workspace, SessionRegistry &sessions,
             QuotaAccountant &quota);

  /**
   * @brief Persist one chunk of an existing session.
   *
   * In order: range check against the session's totalChunks, SHA-256 gate,
   * quota reservation of (new size - previously stored size), atomic
   * replace of the payload file, quota commit. Writers to the same index
   * serialise; different indices proceed in parallel. Nothing is written
   * and nothing is charged unless every check passes.
   *
   * @return Size of the stored payload.
   */
  Result<std::uint64_t> putChunk(const TenantId &tenant,
                                 const std::string &sessionId,
                                 std::uint32_t index,
                                 std::span<const std::byte> bytes,
                                 std::string_view declaredChecksum,
                                 const CancellationToken *token = nullptr);

  std::vector<std::uint32_t> listIndices(const TenantId &tenant,
                                         const std::string &sessionId) const;

  /// IncompleteUpload (with the missing indices) unless every index in
  /// [0, totalChunks) is present.
  Result<ChunkCursor> readOrdered(const TenantId &tenant,
                                  const std::string &sessionId,
                                  std::uint32_t totalChunks) const;

  /// Total payload bytes currently stored for the session.
  std::uint64_t storedBytes(const TenantId &tenant,
                            const std::string &sessionId) const;

  /**
   * @brief Delete every payload of the session. Idempotent.
   *
   * Quota is not touched here; the caller decides whether the bytes are
   * released (sweep) or carried over to an artifact (merge).
   *
   * @return Bytes removed.
   */
  Result<std::uint64_t> discard(const TenantId &tenant,
                                const std::string &sessionId);

private:
  Status writePayload(const std::filesystem::path &target,
                      std::span<const std::byte> bytes) const;

  Workspace &workspace_;
  SessionRegistry &sessions_;
  QuotaAccountant &quota_;
  LockTable<std::mutex> indexLocks_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_STORE_H

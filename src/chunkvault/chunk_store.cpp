#include "chunkvault/chunk_store.h"
#include "chunkvault/checksum.h"
#include "chunkvault/names.h"
#include "utilities/digest.hpp"
#include "utilities/logger.h"

#include <fstream>
#include <shared_mutex>

namespace fs = std::filesystem;

namespace chunkvault {

ChunkCursor::ChunkCursor(std::vector<fs::path> paths)
    : paths_(std::move(paths)) {}

Result<bool> ChunkCursor::next(std::vector<std::byte> &out) {
  if (position_ >= paths_.size())
    return false;
  const fs::path &path = paths_[position_];

  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  if (ec == std::errc::no_such_file_or_directory) {
    Error err = makeError(ErrorCode::IncompleteUpload,
                          "chunk " + std::to_string(position_) +
                              " disappeared while reading");
    err.missingIndices.push_back(static_cast<std::uint32_t>(position_));
    return err;
  }
  if (ec)
    return makeError(ErrorCode::StorageIO,
                     "cannot stat " + path.string() + ": " + ec.message());

  std::ifstream in(path, std::ios::binary);
  if (!in)
    return makeError(ErrorCode::StorageIO, "cannot open " + path.string());
  out.resize(static_cast<std::size_t>(size));
  if (size > 0) {
    in.read(reinterpret_cast<char *>(out.data()),
            static_cast<std::streamsize>(size));
    if (in.gcount() != static_cast<std::streamsize>(size))
      return makeError(ErrorCode::StorageIO,
                       "short read from " + path.string());
  }
  ++position_;
  return true;
}

ChunkStore::ChunkStore(Workspace &workspace, SessionRegistry &sessions,
                       QuotaAccountant &quota)
    : workspace_(workspace), sessions_(sessions), quota_(quota) {}

Result<std::uint64_t> ChunkStore::putChunk(const TenantId &tenant,
                                           const std::string &sessionId,
                                           std::uint32_t index,
                                           std::span<const std::byte> bytes,
                                           std::string_view declaredChecksum,
                                           const CancellationToken *token) {
  // Shared: other chunk writers proceed, merge and sweep are excluded.
  auto sessionLease = workspace_.sessionLock(tenant, sessionId);
  std::shared_lock<std::shared_mutex> sessionLock(sessionLease.mutex());

  auto session = sessions_.describe(tenant, sessionId);
  if (!session)
    return session.error();
  const std::uint32_t totalChunks = session.value().totalChunks;
  if (index >= totalChunks)
    return makeError(ErrorCode::InvalidIndex,
                     "chunk index " + std::to_string(index) +
                         " outside [0, " + std::to_string(totalChunks) + ")");

  if (!ChecksumVerifier::verify(bytes, declaredChecksum))
    return makeError(ErrorCode::ChecksumMismatch,
                     "checksum mismatch for chunk " + std::to_string(index));

  if (auto stop = checkCancelled(token))
    return *stop;

  const fs::path target = workspace_.chunkPath(tenant, sessionId, index);
  auto indexLease = indexLocks_.acquire(target.string());
  std::lock_guard<std::mutex> indexLock(indexLease.mutex());

  std::uint64_t priorSize = 0;
  std::error_code ec;
  const auto existing = fs::file_size(target, ec);
  if (!ec) {
    priorSize = existing;
  } else if (ec != std::errc::no_such_file_or_directory) {
    return makeError(ErrorCode::StorageIO,
                     "cannot stat " + target.string() + ": " + ec.message());
  }

  // Old bytes are returned before new bytes are charged: only the
  // difference is reserved.
  const std::int64_t delta = static_cast<std::int64_t>(bytes.size()) -
                             static_cast<std::int64_t>(priorSize);
  auto reserved = quota_.reserve(tenant, delta);
  if (!reserved)
    return reserved.error();
  QuotaAccountant::Reservation reservation = std::move(reserved).value();

  if (auto stop = checkCancelled(token))
    return *stop;

  auto written = writePayload(target, bytes);
  if (!written) {
    Logger::getInstance().log(LogLevel::ERROR, "Chunk write failed",
                              {{"tenant", tenant},
                               {"session", sessionId},
                               {"index", std::to_string(index)},
                               {"error", written.error().message}});
    return written.error();
  }
  reservation.commit();

  Logger::getInstance().log(LogLevel::DEBUG, "Chunk stored",
                            {{"tenant", tenant},
                             {"session", sessionId},
                             {"index", std::to_string(index)},
                             {"bytes", std::to_string(bytes.size())},
                             {"quota_delta", std::to_string(delta)}});
  return static_cast<std::uint64_t>(bytes.size());
}

Status ChunkStore::writePayload(const fs::path &target,
                                std::span<const std::byte> bytes) const {
  const fs::path temp =
      target.parent_path() / (target.filename().string() +
                              Workspace::kPartialMarker + utils::randomHex(8));
  std::error_code ec;
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out)
      return makeError(ErrorCode::StorageIO, "cannot create " + temp.string());
    if (!bytes.empty())
      out.write(reinterpret_cast<const char *>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
      fs::remove(temp, ec);
      return makeError(ErrorCode::StorageIO, "cannot write " + temp.string());
    }
  }
  // rename() replaces any prior payload for the index atomically.
  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    return makeError(ErrorCode::StorageIO,
                     "cannot publish " + target.string() + ": " + ec.message());
  }
  return okStatus();
}

std::vector<std::uint32_t>
ChunkStore::listIndices(const TenantId &tenant,
                        const std::string &sessionId) const {
  return workspace_.listChunkIndices(tenant, sessionId);
}

Result<ChunkCursor> ChunkStore::readOrdered(const TenantId &tenant,
                                            const std::string &sessionId,
                                            std::uint32_t totalChunks) const {
  const auto present = listIndices(tenant, sessionId);
  std::vector<std::uint32_t> missing;
  std::size_t cursor = 0;
  for (std::uint32_t i = 0; i < totalChunks; ++i) {
    while (cursor < present.size() && present[cursor] < i)
      ++cursor;
    if (cursor == present.size() || present[cursor] != i)
      missing.push_back(i);
  }
  if (!missing.empty()) {
    Error err = makeError(ErrorCode::IncompleteUpload,
                          std::to_string(missing.size()) + " of " +
                              std::to_string(totalChunks) +
                              " chunks missing");
    err.missingIndices = std::move(missing);
    return err;
  }

  std::vector<fs::path> paths;
  paths.reserve(totalChunks);
  for (std::uint32_t i = 0; i < totalChunks; ++i)
    paths.push_back(workspace_.chunkPath(tenant, sessionId, i));
  return ChunkCursor(std::move(paths));
}

std::uint64_t ChunkStore::storedBytes(const TenantId &tenant,
                                      const std::string &sessionId) const {
  std::uint64_t total = 0;
  for (auto index : listIndices(tenant, sessionId)) {
    std::error_code ec;
    const auto size =
        fs::file_size(workspace_.chunkPath(tenant, sessionId, index), ec);
    if (!ec)
      total += size;
  }
  return total;
}

Result<std::uint64_t> ChunkStore::discard(const TenantId &tenant,
                                          const std::string &sessionId) {
  std::uint64_t freed = 0;
  std::error_code ec;
  fs::directory_iterator it(workspace_.sessionDir(tenant, sessionId), ec);
  if (ec == std::errc::no_such_file_or_directory)
    return freed;
  if (ec)
    return makeError(ErrorCode::StorageIO,
                     "cannot list session workspace: " + ec.message());

  std::vector<fs::path> victims;
  for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (Workspace::isPartialFile(name) ||
        Workspace::parseChunkFileName(name)) {
      victims.push_back(it->path());
    }
  }
  if (ec)
    return makeError(ErrorCode::StorageIO,
                     "cannot list session workspace: " + ec.message());

  for (const auto &path : victims) {
    const std::string name = path.filename().string();
    std::error_code sizeEc;
    const auto size = fs::file_size(path, sizeEc);
    std::error_code removeEc;
    const bool removed = fs::remove(path, removeEc);
    if (removeEc)
      return makeError(ErrorCode::StorageIO, "cannot remove " + path.string() +
                                                 ": " + removeEc.message());
    // Partial files were never charged.
    if (removed && !sizeEc && !Workspace::isPartialFile(name))
      freed += size;
  }
  return freed;
}

} // namespace chunkvault

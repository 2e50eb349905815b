#include "chunkvault/merge_engine.h"
#include "utilities/digest.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <mutex>
#include <shared_mutex>
#include <vector>

namespace chunkvault {

namespace {

void countMerge(const char *result) {
  MetricsRegistry::instance().incrementCounter("chunkvault_merges_total", 1.0,
                                               {{"result", result}});
}

} // namespace

MergeEngine::MergeEngine(Workspace &workspace, SessionRegistry &sessions,
                         ChunkStore &chunks, ArtifactStore &artifacts,
                         QuotaAccountant &quota)
    : workspace_(workspace), sessions_(sessions), chunks_(chunks),
      artifacts_(artifacts), quota_(quota) {}

Result<ArtifactInfo> MergeEngine::merge(const TenantId &tenant,
                                        const std::string &sessionId,
                                        const CancellationToken *token) {
  auto sessionLease = workspace_.sessionLock(tenant, sessionId);
  std::unique_lock<std::shared_mutex> sessionLock(sessionLease.mutex());

  auto described = sessions_.describe(tenant, sessionId);
  if (!described) {
    countMerge("not_found");
    return described.error();
  }
  const SessionInfo session = described.value();
  const LogFields context{{"tenant", tenant},
                          {"session", sessionId},
                          {"category", session.category},
                          {"filename", session.filename}};

  auto cursor = chunks_.readOrdered(tenant, sessionId, session.totalChunks);
  if (!cursor) {
    countMerge("incomplete");
    Logger::getInstance().log(LogLevel::INFO, "Merge refused: " +
                                                  cursor.error().message,
                              context);
    return cursor.error();
  }

  std::unique_ptr<ArtifactSink> sink;
  utils::Sha256Stream digest;
  std::uint64_t written = 0;
  try {
    sink = artifacts_.openForWrite(tenant, session.category, session.filename);
    std::vector<std::byte> buffer;
    while (true) {
      if (auto stop = checkCancelled(token)) {
        sink->abort();
        countMerge("cancelled");
        return *stop;
      }
      auto more = cursor.value().next(buffer);
      if (!more) {
        sink->abort();
        countMerge("failed");
        Logger::getInstance().log(LogLevel::ERROR,
                                  "Merge read failed: " + more.error().message,
                                  context);
        return more.error();
      }
      if (!more.value())
        break;
      sink->write(buffer);
      digest.update(buffer);
      written += buffer.size();
    }
  } catch (const std::exception &e) {
    if (sink)
      sink->abort();
    countMerge("failed");
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("Merge write failed: ") + e.what(),
                              context);
    return makeError(ErrorCode::StorageIO,
                     std::string("artifact write failed: ") + e.what());
  }

  std::uint64_t replacedBytes = 0;
  {
    auto nameLease =
        artifacts_.lockFor(tenant, session.category, session.filename);
    std::lock_guard<std::mutex> nameLock(nameLease.mutex());
    if (auto previous =
            artifacts_.stat(tenant, session.category, session.filename))
      replacedBytes = previous->size;
    try {
      sink->commit();
    } catch (const std::exception &e) {
      sink->abort();
      countMerge("failed");
      Logger::getInstance().log(
          LogLevel::ERROR, std::string("Merge commit failed: ") + e.what(),
          context);
      return makeError(ErrorCode::StorageIO,
                       std::string("artifact commit failed: ") + e.what());
    }
    // Last merge wins; the replaced artifact stops being billable.
    quota_.release(tenant, replacedBytes);
  }

  // The chunk bytes are billed as the artifact now. Retire drops the
  // record before the files, so leftovers are orphans that the sweeper
  // deletes without releasing quota.
  auto retired = sessions_.retire(tenant, sessionId);
  if (!retired) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Session retire after merge failed: " +
                                  retired.error().message,
                              context);
    // A surviving record must not own billed chunk files, or a later sweep
    // would release them a second time.
    auto discarded = chunks_.discard(tenant, sessionId);
    if (!discarded) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Chunk cleanup after merge failed: " +
                                    discarded.error().message,
                                context);
    }
  }

  ArtifactInfo info;
  if (auto stored =
          artifacts_.stat(tenant, session.category, session.filename)) {
    info = *stored;
  } else {
    info.category = session.category;
    info.filename = session.filename;
    info.modified = Clock::now();
  }
  info.size = written;
  info.sha256 = utils::toHex(digest.finish());

  countMerge("ok");
  LogFields done = context;
  done["bytes"] = std::to_string(written);
  done["replaced_bytes"] = std::to_string(replacedBytes);
  Logger::getInstance().log(LogLevel::INFO, "Upload merged", done);
  return info;
}

} // namespace chunkvault

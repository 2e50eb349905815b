#include "chunkvault/retention_sweeper.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <filesystem>
#include <shared_mutex>

namespace fs = std::filesystem;

namespace chunkvault {

RetentionSweeper::RetentionSweeper(Workspace &workspace,
                                   SessionRegistry &sessions,
                                   ChunkStore &chunks, QuotaAccountant &quota,
                                   std::chrono::seconds window,
                                   std::chrono::seconds tick)
    : workspace_(workspace), sessions_(sessions), chunks_(chunks),
      quota_(quota), window_(window), tick_(tick) {}

RetentionSweeper::~RetentionSweeper() { stop(); }

void RetentionSweeper::start() {
  if (running_.exchange(true))
    return;
  worker_ = std::thread(&RetentionSweeper::threadFunc, this);
}

void RetentionSweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(wakeMutex_);
    if (!running_)
      return;
    running_ = false;
  }
  wake_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void RetentionSweeper::threadFunc() {
  while (running_) {
    try {
      runOnce();
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("Retention pass failed: ") +
                                    e.what());
    }
    std::unique_lock<std::mutex> lock(wakeMutex_);
    wake_.wait_for(lock, tick_, [this] { return !running_; });
  }
}

std::size_t RetentionSweeper::runOnce() { return sweep(Clock::now(), window_); }

std::size_t RetentionSweeper::sweep(Clock::time_point now,
                                    std::chrono::seconds window) {
  const Clock::time_point cutoff = now - window;
  std::size_t removed = 0;
  // Enumerate first, then act per session.
  for (const auto &candidate : sessions_.listSessions()) {
    if (candidate.createdAt >= cutoff)
      continue;
    if (sweepSession(candidate, cutoff))
      ++removed;
  }
  sweepOrphans(cutoff);

  if (removed > 0) {
    MetricsRegistry::instance().incrementCounter(
        "chunkvault_sessions_swept_total", static_cast<double>(removed));
    Logger::getInstance().log(LogLevel::INFO, "Retention sweep finished",
                              {{"removed", std::to_string(removed)},
                               {"window_seconds",
                                std::to_string(window.count())}});
  }
  return removed;
}

bool RetentionSweeper::sweepSession(const SessionInfo &candidate,
                                    Clock::time_point cutoff) {
  const TenantId &tenant = candidate.owner;
  const std::string &sessionId = candidate.sessionId;
  auto sessionLease = workspace_.sessionLock(tenant, sessionId);
  std::unique_lock<std::shared_mutex> sessionLock(sessionLease.mutex());

  // Re-read under the lock: the session may have been merged, swept or
  // re-created since it was listed.
  auto current = sessions_.describe(tenant, sessionId);
  if (!current || current.value().createdAt >= cutoff)
    return false;

  const LogFields context{{"tenant", tenant}, {"session", sessionId}};
  auto freed = chunks_.discard(tenant, sessionId);
  if (!freed) {
    // Whatever was deleted before the failure is gone from disk; the rest
    // stays billed until the next pass. Recovery rescans reconcile usage.
    Logger::getInstance().log(LogLevel::ERROR,
                              "Cannot discard stale session chunks: " +
                                  freed.error().message,
                              context);
    return false;
  }
  quota_.release(tenant, freed.value());

  auto retired = sessions_.retire(tenant, sessionId);
  if (!retired) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Cannot retire stale session: " +
                                  retired.error().message,
                              context);
    return false;
  }

  LogFields done = context;
  done["released_bytes"] = std::to_string(freed.value());
  Logger::getInstance().log(LogLevel::INFO, "Stale upload session removed",
                            done);
  return true;
}

void RetentionSweeper::sweepOrphans(Clock::time_point cutoff) {
  for (const auto &entry : workspace_.listEntries()) {
    if (entry.hasMetadata)
      continue;
    auto sessionLease = workspace_.sessionLock(entry.tenant, entry.sessionId);
    std::unique_lock<std::shared_mutex> sessionLock(sessionLease.mutex());
    std::error_code ec;
    if (fs::exists(entry.dir / Workspace::kMetadataFile, ec))
      continue;
    const auto mtime = fs::last_write_time(entry.dir, ec);
    if (ec)
      continue;
    const auto modified = std::chrono::time_point_cast<Clock::duration>(
        std::chrono::file_clock::to_sys(mtime));
    if (modified >= cutoff)
      continue;
    fs::remove_all(entry.dir, ec);
    if (ec) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Cannot remove orphaned workspace",
                                {{"path", entry.dir.string()},
                                 {"error", ec.message()}});
    }
  }
}

} // namespace chunkvault

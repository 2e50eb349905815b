#pragma once
#ifndef CHUNKVAULT_RETENTION_SWEEPER_H
#define CHUNKVAULT_RETENTION_SWEEPER_H

#include "chunkvault/chunk_store.h"
#include "chunkvault/quota_accountant.h"
#include "chunkvault/session_registry.h"
#include "chunkvault/workspace.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace chunkvault {

/**
 * @brief Discards upload sessions older than the retention window.
 *
 * Each pass enumerates sessions first and then acts on them one at a time
 * under that session's exclusive lock. A session that was merged or swept
 * in between is skipped without error. Stale workspace directories that
 * lost their metadata (interrupted retire) are removed too; they are not
 * billed, so no quota is released for them.
 */
class RetentionSweeper {
public:
  /**
   * @param window Sessions created more than this long ago are discarded.
   * @param tick Interval between passes when running in the background.
   */
  RetentionSweeper(Workspace &workspace, SessionRegistry &sessions,
                   ChunkStore &chunks, QuotaAccountant &quota,
                   std::chrono::seconds window,
                   std::chrono::seconds tick = std::chrono::hours(1));

  ~RetentionSweeper();

  RetentionSweeper(const RetentionSweeper &) = delete;
  RetentionSweeper &operator=(const RetentionSweeper &) = delete;

  /// @return Number of sessions removed by this call.
  std::size_t sweep(Clock::time_point now, std::chrono::seconds window);

  /** Perform a single pass with the configured window. */
  std::size_t runOnce();

  /** Start the background sweep thread. */
  void start();
  /** Stop the background sweep thread. */
  void stop();

  bool running() const { return running_; }

private:
  void threadFunc();
  bool sweepSession(const SessionInfo &candidate, Clock::time_point cutoff);
  void sweepOrphans(Clock::time_point cutoff);

  Workspace &workspace_;
  SessionRegistry &sessions_;
  ChunkStore &chunks_;
  QuotaAccountant &quota_;
  std::chrono::seconds window_;
  std::chrono::seconds tick_;
  std::atomic<bool> running_{false};
  std::mutex wakeMutex_;
  std::condition_variable wake_;
  std::thread worker_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_RETENTION_SWEEPER_H

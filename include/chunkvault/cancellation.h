#ifndef CHUNKVAULT_CANCELLATION_H
#define CHUNKVAULT_CANCELLATION_H

#include "chunkvault/errors.h"

#include <atomic>
#include <chrono>
#include <optional>

namespace chunkvault {

/**
 * @brief Cancel flag plus optional deadline, polled between engine steps.
 *
 * The transport layer owns the token; engine operations only observe it.
 */
class CancellationToken {
public:
  using SteadyClock = std::chrono::steady_clock;

  CancellationToken() = default;
  explicit CancellationToken(SteadyClock::duration timeout)
      : deadline_(SteadyClock::now() + timeout) {}

  void cancel() noexcept { cancelled_.store(true); }
  bool cancelled() const noexcept { return cancelled_.load(); }
  bool expired() const noexcept {
    return deadline_ && SteadyClock::now() >= *deadline_;
  }

  /// Cancelled or Timeout when the caller has given up, nullopt otherwise.
  std::optional<Error> check() const {
    if (cancelled())
      return makeError(ErrorCode::Cancelled, "operation cancelled");
    if (expired())
      return makeError(ErrorCode::Timeout, "operation deadline exceeded");
    return std::nullopt;
  }

private:
  std::atomic<bool> cancelled_{false};
  std::optional<SteadyClock::time_point> deadline_;
};

/// Null-tolerant helper for optional tokens.
inline std::optional<Error> checkCancelled(const CancellationToken *token) {
  return token ? token->check() : std::nullopt;
}

} // namespace chunkvault

#endif // CHUNKVAULT_CANCELLATION_H

#ifndef CHUNKVAULT_ERRORS_H
#define CHUNKVAULT_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chunkvault {

enum class ErrorCode {
  InvalidIndex,     ///< Index outside the declared range.
  ChecksumMismatch, ///< Payload does not match the declared SHA-256.
  QuotaExceeded,    ///< Tenant ceiling would be breached.
  SessionNotFound,  ///< Unknown, merged or swept session.
  SessionConflict,  ///< Chunk declaration differs from the session record.
  IncompleteUpload, ///< Merge attempted with chunks missing.
  ArtifactNotFound,
  StorageIO,        ///< Underlying read/write failure. Retryable.
  Unauthenticated,
  Unauthorized,
  InvalidArgument,
  Timeout,
  Cancelled
};

const char *errorCodeName(ErrorCode code);

struct Error {
  ErrorCode code;
  std::string message;
  /// Sorted ascending; only set for IncompleteUpload.
  std::vector<std::uint32_t> missingIndices;
};

inline Error makeError(ErrorCode code, std::string message) {
  return Error{code, std::move(message), {}};
}

/**
 * @brief Value-or-error return type used by every engine operation.
 *
 * Accessing the wrong alternative is a programming error and throws
 * std::logic_error.
 */
template <typename T> class Result {
public:
  Result(T value) : state_(std::move(value)) {}
  Result(Error error) : state_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(state_); }
  explicit operator bool() const { return ok(); }

  const T &value() const & {
    requireValue();
    return std::get<T>(state_);
  }
  T &value() & {
    requireValue();
    return std::get<T>(state_);
  }
  T &&value() && {
    requireValue();
    return std::get<T>(std::move(state_));
  }

  const Error &error() const {
    if (ok()) {
      throw std::logic_error("Result holds a value, not an error");
    }
    return std::get<Error>(state_);
  }

  ErrorCode code() const { return error().code; }

private:
  void requireValue() const {
    if (!ok()) {
      const auto &err = std::get<Error>(state_);
      throw std::logic_error(std::string("Result holds error ") +
                             errorCodeName(err.code) + ": " + err.message);
    }
  }

  std::variant<T, Error> state_;
};

/// Result of an operation with nothing to return.
using Status = Result<std::monostate>;

inline Status okStatus() { return Status(std::monostate{}); }

} // namespace chunkvault

#endif // CHUNKVAULT_ERRORS_H

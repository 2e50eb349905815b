#include "chunkvault/errors.h"

namespace chunkvault {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::InvalidIndex:
    return "InvalidIndex";
  case ErrorCode::ChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorCode::QuotaExceeded:
    return "QuotaExceeded";
  case ErrorCode::SessionNotFound:
    return "SessionNotFound";
  case ErrorCode::SessionConflict:
    return "SessionConflict";
  case ErrorCode::IncompleteUpload:
    return "IncompleteUpload";
  case ErrorCode::ArtifactNotFound:
    return "ArtifactNotFound";
  case ErrorCode::StorageIO:
    return "StorageIO";
  case ErrorCode::Unauthenticated:
    return "Unauthenticated";
  case ErrorCode::Unauthorized:
    return "Unauthorized";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

} // namespace chunkvault

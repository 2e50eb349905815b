#ifndef CHUNKVAULT_TYPES_H
#define CHUNKVAULT_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault {

using TenantId = std::string;
using Clock = std::chrono::system_clock;

/// Durable description of an in-flight upload.
struct SessionInfo {
  std::string sessionId;
  TenantId owner;
  std::string filename;
  std::string category;
  std::uint32_t totalChunks{0};
  Clock::time_point createdAt{};
};

/// Reply to a chunk upload.
struct ChunkAck {
  std::uint32_t index{0};
  std::uint64_t storedSize{0};
  std::vector<std::uint32_t> receivedIndices;
  bool complete{false};
};

struct UploadStatus {
  bool exists{false};
  std::vector<std::uint32_t> receivedIndices;
  std::uint32_t totalChunks{0};
  std::string filename;
  std::string category;
  bool complete{false};
  double progress{0.0}; ///< Percentage of declared chunks received.
};

struct ArtifactInfo {
  std::string category;
  std::string filename;
  std::uint64_t size{0};
  Clock::time_point modified{};
  std::string sha256; ///< Whole-artifact digest, filled in by merge only.
};

struct TenantUsage {
  std::uint64_t usedBytes{0};
  std::uint64_t quotaBytes{0};
};

} // namespace chunkvault

#endif // CHUNKVAULT_TYPES_H

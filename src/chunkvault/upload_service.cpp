#include "chunkvault/upload_service.h"
#include "chunkvault/checksum.h"
#include "chunkvault/names.h"
#include "utilities/digest.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

Error rejectChunk(const TenantId &tenant, const ChunkUpload &upload,
                  Error error) {
  MetricsRegistry::instance().incrementCounter(
      "chunkvault_chunks_rejected_total", 1.0,
      {{"reason", errorCodeName(error.code)}});
  const LogLevel level =
      error.code == ErrorCode::StorageIO ? LogLevel::ERROR : LogLevel::WARN;
  Logger::getInstance().log(level, "Chunk rejected: " + error.message,
                            {{"tenant", tenant},
                             {"session", upload.sessionId},
                             {"index", std::to_string(upload.index)},
                             {"reason", errorCodeName(error.code)}});
  return error;
}

// Storage exceptions (filesystem, stream, parser) become StorageIO at the
// facade. Logic errors are bugs and propagate.
template <typename T, typename Fn>
Result<T> guarded(const char *operation, Fn &&fn) {
  try {
    return fn();
  } catch (const std::runtime_error &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string(operation) + " failed: " + e.what());
    return makeError(ErrorCode::StorageIO,
                     std::string(operation) + " failed: " + e.what());
  }
}

} // namespace

UploadService::UploadService(Config config, const QuotaLedger &ledger)
    : UploadService(std::move(config), ledger, nullptr) {}

UploadService::UploadService(Config config, const QuotaLedger &ledger,
                             std::unique_ptr<ArtifactStore> artifacts)
    : config_(std::move(config)),
      workspace_(fs::path(config_.dataDir) / "workspace"), quota_(ledger),
      sessions_(workspace_), chunks_(workspace_, sessions_, quota_),
      artifacts_(artifacts ? std::move(artifacts)
                           : std::make_unique<ArtifactStore>(
                                 fs::path(config_.dataDir) / "artifacts")),
      merger_(workspace_, sessions_, chunks_, *artifacts_, quota_),
      sweeper_(std::make_unique<RetentionSweeper>(
          workspace_, sessions_, chunks_, quota_, config_.retention,
          config_.sweepInterval)) {
  utils::ensureSodium();
  auto prepared = prepareDirectories();
  if (!prepared)
    throw std::runtime_error(prepared.error().message);
}

UploadService::~UploadService() { sweeper_->stop(); }

Status UploadService::prepareDirectories() const {
  std::error_code ec;
  fs::create_directories(workspace_.root(), ec);
  if (ec)
    return makeError(ErrorCode::StorageIO, "cannot create " +
                                               workspace_.root().string() +
                                               ": " + ec.message());
  fs::create_directories(artifacts_->root(), ec);
  if (ec)
    return makeError(ErrorCode::StorageIO, "cannot create " +
                                               artifacts_->root().string() +
                                               ": " + ec.message());
  return okStatus();
}

std::string UploadService::newSessionId() { return utils::randomHex(16); }

Result<TenantId>
UploadService::authenticate(const IdentityProvider &identity) const {
  auto tenant = identity.currentTenant();
  if (!tenant)
    return makeError(ErrorCode::Unauthenticated, "no authenticated tenant");
  if (!isValidIdentifier(*tenant))
    return makeError(ErrorCode::Unauthenticated, "malformed tenant id");
  return *tenant;
}

Result<ChunkAck>
UploadService::beginOrContinueChunk(const IdentityProvider &identity,
                                    const ChunkUpload &upload,
                                    const CancellationToken *token) {
  return guarded<ChunkAck>("chunk upload", [&] {
    return storeChunk(identity, upload, token);
  });
}

Result<ChunkAck>
UploadService::storeChunk(const IdentityProvider &identity,
                          const ChunkUpload &upload,
                          const CancellationToken *token) {
  auto who = authenticate(identity);
  if (!who)
    return who.error();
  const TenantId &tenant = who.value();

  if (upload.bytes.size() > config_.maxChunkBytes)
    return rejectChunk(tenant, upload,
                       makeError(ErrorCode::InvalidArgument,
                                 "chunk larger than " +
                                     std::to_string(config_.maxChunkBytes) +
                                     " bytes"));
  if (upload.totalChunks > config_.maxTotalChunks)
    return rejectChunk(tenant, upload,
                       makeError(ErrorCode::InvalidArgument,
                                 "totalChunks above " +
                                     std::to_string(config_.maxTotalChunks)));

  auto existing = sessions_.describe(tenant, upload.sessionId);
  if (!existing) {
    if (existing.code() != ErrorCode::SessionNotFound)
      return rejectChunk(tenant, upload, existing.error());
    // Validate before creating so a bad first chunk leaves no session behind.
    if (upload.index >= upload.totalChunks)
      return rejectChunk(tenant, upload,
                         makeError(ErrorCode::InvalidIndex,
                                   "chunk index " +
                                       std::to_string(upload.index) +
                                       " outside [0, " +
                                       std::to_string(upload.totalChunks) +
                                       ")"));
    if (!ChecksumVerifier::verify(upload.bytes, upload.checksum))
      return rejectChunk(tenant, upload,
                         makeError(ErrorCode::ChecksumMismatch,
                                   "checksum mismatch for chunk " +
                                       std::to_string(upload.index)));
  }

  auto session = sessions_.ensureSession(tenant, upload.sessionId,
                                         upload.filename, upload.category,
                                         upload.totalChunks);
  if (!session)
    return rejectChunk(tenant, upload, session.error());

  auto stored = chunks_.putChunk(tenant, upload.sessionId, upload.index,
                                 upload.bytes, upload.checksum, token);
  if (!stored)
    return rejectChunk(tenant, upload, stored.error());

  MetricsRegistry::instance().incrementCounter(
      "chunkvault_chunks_accepted_total");
  MetricsRegistry::instance().observe("chunkvault_chunk_bytes",
                                      static_cast<double>(stored.value()));

  ChunkAck ack;
  ack.index = upload.index;
  ack.storedSize = stored.value();
  ack.receivedIndices = chunks_.listIndices(tenant, upload.sessionId);
  ack.complete = ack.receivedIndices.size() == session.value().totalChunks;
  return ack;
}

Result<UploadStatus> UploadService::status(const IdentityProvider &identity,
                                           const std::string &sessionId) {
  return guarded<UploadStatus>("status",
                               [&] { return describeUpload(identity, sessionId); });
}

Result<UploadStatus>
UploadService::describeUpload(const IdentityProvider &identity,
                              const std::string &sessionId) {
  auto who = authenticate(identity);
  if (!who)
    return who.error();

  UploadStatus report;
  auto session = sessions_.describe(who.value(), sessionId);
  if (!session) {
    if (session.code() == ErrorCode::SessionNotFound)
      return report;
    return session.error();
  }
  const SessionInfo &info = session.value();
  report.exists = true;
  report.totalChunks = info.totalChunks;
  report.filename = info.filename;
  report.category = info.category;
  report.receivedIndices =
      sessions_.listReceivedIndices(who.value(), sessionId);
  report.complete = report.receivedIndices.size() == info.totalChunks;
  report.progress = 100.0 * static_cast<double>(report.receivedIndices.size()) /
                    static_cast<double>(info.totalChunks);
  return report;
}

Result<ArtifactInfo> UploadService::merge(const IdentityProvider &identity,
                                          const std::string &sessionId,
                                          const CancellationToken *token) {
  auto who = authenticate(identity);
  if (!who)
    return who.error();
  return guarded<ArtifactInfo>(
      "merge", [&] { return merger_.merge(who.value(), sessionId, token); });
}

std::size_t UploadService::sweep() { return sweeper_->runOnce(); }

std::size_t UploadService::sweep(Clock::time_point now) {
  return sweeper_->sweep(now, config_.retention);
}

Result<TenantUsage> UploadService::usage(const IdentityProvider &identity) {
  auto who = authenticate(identity);
  if (!who)
    return who.error();
  return quota_.usage(who.value());
}

Result<ArtifactInfo>
UploadService::statArtifact(const IdentityProvider &identity,
                            const std::string &category,
                            const std::string &filename) {
  auto who = authenticate(identity);
  if (!who)
    return who.error();
  if (!isValidLabel(category) || !isValidLabel(filename))
    return makeError(ErrorCode::InvalidArgument,
                     "invalid artifact name " + category + "/" + filename);
  auto info = guarded<std::optional<ArtifactInfo>>(
      "artifact stat",
      [&] { return artifacts_->stat(who.value(), category, filename); });
  if (!info)
    return info.error();
  if (!info.value())
    return makeError(ErrorCode::ArtifactNotFound,
                     "no artifact " + category + "/" + filename);
  return *info.value();
}

Status UploadService::deleteArtifact(const IdentityProvider &identity,
                                     const std::string &category,
                                     const std::string &filename) {
  auto who = authenticate(identity);
  if (!who)
    return who.error();
  const TenantId &tenant = who.value();
  if (!isValidLabel(category) || !isValidLabel(filename))
    return makeError(ErrorCode::InvalidArgument,
                     "invalid artifact name " + category + "/" + filename);

  auto nameLease = artifacts_->lockFor(tenant, category, filename);
  std::lock_guard<std::mutex> nameLock(nameLease.mutex());
  auto freed = guarded<std::uint64_t>("artifact delete", [&] {
    return artifacts_->remove(tenant, category, filename);
  });
  if (!freed)
    return freed.error();
  quota_.release(tenant, freed.value());
  Logger::getInstance().log(LogLevel::INFO, "Artifact deleted",
                            {{"tenant", tenant},
                             {"category", category},
                             {"filename", filename},
                             {"released_bytes",
                              std::to_string(freed.value())}});
  return okStatus();
}

Status UploadService::recoverUsage() {
  std::map<TenantId, std::uint64_t> totals;
  for (const auto &tenant : quota_.knownTenants())
    totals[tenant] = 0;

  std::size_t partials = 0;
  try {
    for (const auto &entry : workspace_.listEntries()) {
      for (const auto &file : fs::directory_iterator(entry.dir)) {
        const std::string name = file.path().filename().string();
        if (Workspace::isPartialFile(name)) {
          fs::remove(file.path());
          ++partials;
        }
      }
      // Chunks without a session record are orphans, never billed.
      if (!entry.hasMetadata)
        continue;
      totals[entry.tenant] += chunks_.storedBytes(entry.tenant, entry.sessionId);
    }
    partials += artifacts_->removeStaleTemporaries();
    for (const auto &tenant : artifacts_->tenants())
      totals[tenant] += artifacts_->totalBytes(tenant);
  } catch (const std::runtime_error &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("Usage recovery failed: ") + e.what());
    return makeError(ErrorCode::StorageIO,
                     std::string("usage recovery failed: ") + e.what());
  }

  for (const auto &kv : totals) {
    quota_.resetUsage(kv.first, kv.second);
    const TenantUsage usage = quota_.usage(kv.first);
    LogFields fields{{"tenant", kv.first},
                     {"used_bytes", std::to_string(usage.usedBytes)},
                     {"quota_bytes", std::to_string(usage.quotaBytes)}};
    if (usage.usedBytes > usage.quotaBytes) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Recovered usage is above the tenant quota",
                                fields);
    } else {
      Logger::getInstance().log(LogLevel::INFO, "Recovered tenant usage",
                                fields);
    }
  }
  Logger::getInstance().log(LogLevel::INFO, "Usage recovery finished",
                            {{"tenants", std::to_string(totals.size())},
                             {"removed_temporaries",
                              std::to_string(partials)}});
  return okStatus();
}

} // namespace chunkvault

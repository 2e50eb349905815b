#include "chunkvault/session_registry.h"
#include "chunkvault/names.h"
#include "utilities/digest.hpp"
#include "utilities/logger.h"

#include <yaml-cpp/yaml.h>

#include <fstream>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

std::int64_t toMillis(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

Clock::time_point fromMillis(std::int64_t ms) {
  return Clock::time_point(
      std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace

SessionRegistry::SessionRegistry(Workspace &workspace)
    : workspace_(workspace) {}

Result<SessionInfo> SessionRegistry::ensureSession(
    const TenantId &tenant, const std::string &sessionId,
    const std::string &filename, const std::string &category,
    std::uint32_t totalChunks, Clock::time_point createdAt) {
  if (!isValidIdentifier(tenant) || !isValidIdentifier(sessionId))
    return makeError(ErrorCode::InvalidArgument,
                     "tenant and session id must be non-empty identifiers");
  if (!isValidLabel(filename))
    return makeError(ErrorCode::InvalidArgument,
                     "invalid filename '" + filename + "'");
  if (!isValidLabel(category))
    return makeError(ErrorCode::InvalidArgument,
                     "invalid category '" + category + "'");
  if (totalChunks == 0)
    return makeError(ErrorCode::InvalidArgument,
                     "totalChunks must be positive");

  auto createLease = createLocks_.acquire(workspaceKey(tenant, sessionId));
  std::lock_guard<std::mutex> lock(createLease.mutex());

  auto existing = readRecord(tenant, sessionId);
  if (existing) {
    const SessionInfo &info = existing.value();
    if (info.totalChunks != totalChunks || info.filename != filename ||
        info.category != category) {
      return makeError(ErrorCode::SessionConflict,
                       "session " + sessionId + " was declared as " +
                           info.category + "/" + info.filename + " with " +
                           std::to_string(info.totalChunks) + " chunks");
    }
    return existing;
  }
  if (existing.code() != ErrorCode::SessionNotFound)
    return existing;

  SessionInfo info;
  info.sessionId = sessionId;
  info.owner = tenant;
  info.filename = filename;
  info.category = category;
  info.totalChunks = totalChunks;
  // Millisecond precision is what the record stores.
  info.createdAt = fromMillis(toMillis(createdAt));

  auto written = writeRecord(info);
  if (!written)
    return written.error();

  Logger::getInstance().log(LogLevel::INFO, "Upload session created",
                            {{"tenant", tenant},
                             {"session", sessionId},
                             {"filename", filename},
                             {"category", category},
                             {"total_chunks", std::to_string(totalChunks)}});
  return info;
}

Status SessionRegistry::writeRecord(const SessionInfo &info) const {
  const fs::path dir = workspace_.sessionDir(info.owner, info.sessionId);
  const fs::path target = dir / Workspace::kMetadataFile;
  const fs::path temp =
      dir / (std::string(Workspace::kMetadataFile) + Workspace::kPartialMarker +
             utils::randomHex(8));

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "session_id" << YAML::Value << info.sessionId;
  out << YAML::Key << "owner" << YAML::Value << info.owner;
  out << YAML::Key << "filename" << YAML::Value << info.filename;
  out << YAML::Key << "category" << YAML::Value << info.category;
  out << YAML::Key << "total_chunks" << YAML::Value << info.totalChunks;
  out << YAML::Key << "created_at_ms" << YAML::Value << toMillis(info.createdAt);
  out << YAML::EndMap;

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    return makeError(ErrorCode::StorageIO,
                     "cannot create session directory: " + ec.message());

  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    file << out.c_str() << '\n';
    file.close();
    if (!file) {
      fs::remove(temp, ec);
      return makeError(ErrorCode::StorageIO,
                       "cannot write session record " + temp.string());
    }
  }
  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    return makeError(ErrorCode::StorageIO,
                     "cannot publish session record: " + ec.message());
  }
  return okStatus();
}

Result<SessionInfo>
SessionRegistry::readRecord(const TenantId &tenant,
                            const std::string &sessionId) const {
  const fs::path path = workspace_.metadataPath(tenant, sessionId);
  std::error_code ec;
  if (!fs::exists(path, ec))
    return makeError(ErrorCode::SessionNotFound,
                     "no upload session " + sessionId);

  try {
    YAML::Node node = YAML::LoadFile(path.string());
    SessionInfo info;
    info.sessionId = node["session_id"].as<std::string>();
    info.owner = node["owner"].as<std::string>();
    info.filename = node["filename"].as<std::string>();
    info.category = node["category"].as<std::string>();
    info.totalChunks = node["total_chunks"].as<std::uint32_t>();
    info.createdAt = fromMillis(node["created_at_ms"].as<std::int64_t>());
    return info;
  } catch (const YAML::BadFile &) {
    // Retired between the existence check and the read.
    return makeError(ErrorCode::SessionNotFound,
                     "no upload session " + sessionId);
  } catch (const YAML::Exception &e) {
    return makeError(ErrorCode::StorageIO,
                     "corrupt session record " + path.string() + ": " +
                         e.what());
  }
}

Result<SessionInfo>
SessionRegistry::describe(const TenantId &tenant,
                          const std::string &sessionId) const {
  if (!isValidIdentifier(tenant) || !isValidIdentifier(sessionId))
    return makeError(ErrorCode::SessionNotFound,
                     "no upload session " + sessionId);
  auto record = readRecord(tenant, sessionId);
  if (record && (record.value().owner != tenant ||
                 record.value().sessionId != sessionId)) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Session record owner does not match its key",
                              {{"tenant", tenant},
                               {"session", sessionId},
                               {"owner", record.value().owner}});
    return makeError(ErrorCode::Unauthorized,
                     "session " + sessionId + " belongs to another tenant");
  }
  return record;
}

std::vector<std::uint32_t>
SessionRegistry::listReceivedIndices(const TenantId &tenant,
                                     const std::string &sessionId) const {
  return workspace_.listChunkIndices(tenant, sessionId);
}

Status SessionRegistry::retire(const TenantId &tenant,
                               const std::string &sessionId) {
  auto createLease = createLocks_.acquire(workspaceKey(tenant, sessionId));
  std::lock_guard<std::mutex> lock(createLease.mutex());
  std::error_code ec;
  fs::remove(workspace_.metadataPath(tenant, sessionId), ec);
  if (ec && ec != std::errc::no_such_file_or_directory)
    return makeError(ErrorCode::StorageIO,
                     "cannot remove session record: " + ec.message());
  fs::remove_all(workspace_.sessionDir(tenant, sessionId), ec);
  if (ec && ec != std::errc::no_such_file_or_directory)
    return makeError(ErrorCode::StorageIO,
                     "cannot remove session workspace: " + ec.message());
  return okStatus();
}

std::vector<SessionInfo> SessionRegistry::listSessions() const {
  std::vector<SessionInfo> sessions;
  for (const auto &entry : workspace_.listEntries()) {
    if (!entry.hasMetadata)
      continue;
    auto record = describe(entry.tenant, entry.sessionId);
    if (record) {
      sessions.push_back(std::move(record).value());
    } else if (record.code() != ErrorCode::SessionNotFound) {
      Logger::getInstance().log(LogLevel::WARN, "Skipping unreadable session",
                                {{"tenant", entry.tenant},
                                 {"session", entry.sessionId},
                                 {"error", record.error().message}});
    }
  }
  return sessions;
}

} // namespace chunkvault

#include "chunkvault/workspace.h"
#include "chunkvault/names.h"

#include <algorithm>
#include <cstdio>

namespace fs = std::filesystem;

namespace chunkvault {

Workspace::Workspace(fs::path root) : root_(std::move(root)) {}

fs::path Workspace::sessionDir(const TenantId &tenant,
                               const std::string &sessionId) const {
  return root_ / workspaceKey(tenant, sessionId);
}

fs::path Workspace::metadataPath(const TenantId &tenant,
                                 const std::string &sessionId) const {
  return sessionDir(tenant, sessionId) / kMetadataFile;
}

fs::path Workspace::chunkPath(const TenantId &tenant,
                              const std::string &sessionId,
                              std::uint32_t index) const {
  return sessionDir(tenant, sessionId) / chunkFileName(index);
}

std::string Workspace::chunkFileName(std::uint32_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "%s%08u", kChunkPrefix, index);
  return name;
}

std::optional<std::uint32_t>
Workspace::parseChunkFileName(const std::string &name) {
  const std::string prefix(kChunkPrefix);
  if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
    return std::nullopt;
  const std::string digits = name.substr(prefix.size());
  if (!std::all_of(digits.begin(), digits.end(),
                   [](unsigned char c) { return c >= '0' && c <= '9'; }))
    return std::nullopt;
  try {
    unsigned long value = std::stoul(digits);
    if (value > UINT32_MAX)
      return std::nullopt;
    return static_cast<std::uint32_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

bool Workspace::isPartialFile(const std::string &name) {
  return name.find(kPartialMarker) != std::string::npos;
}

std::vector<std::uint32_t>
Workspace::listChunkIndices(const TenantId &tenant,
                            const std::string &sessionId) const {
  std::vector<std::uint32_t> indices;
  std::error_code ec;
  fs::directory_iterator it(sessionDir(tenant, sessionId), ec);
  // A directory that vanished mid-listing simply has no chunks left.
  for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (isPartialFile(name))
      continue;
    if (auto index = parseChunkFileName(name))
      indices.push_back(*index);
  }
  std::sort(indices.begin(), indices.end());
  return indices;
}

std::vector<Workspace::Entry> Workspace::listEntries() const {
  std::vector<Entry> entries;
  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    std::error_code typeEc;
    if (!it->is_directory(typeEc))
      continue;
    auto key = parseWorkspaceKey(it->path().filename().string());
    if (!key)
      continue;
    Entry entry;
    entry.tenant = key->first;
    entry.sessionId = key->second;
    entry.dir = it->path();
    entry.hasMetadata = fs::exists(it->path() / kMetadataFile, typeEc);
    entries.push_back(std::move(entry));
  }
  return entries;
}

Workspace::SessionLease Workspace::sessionLock(const TenantId &tenant,
                                              const std::string &sessionId) {
  return sessionLocks_.acquire(workspaceKey(tenant, sessionId));
}

std::size_t Workspace::sessionLockHolders(const TenantId &tenant,
                                          const std::string &sessionId) const {
  return sessionLocks_.holders(workspaceKey(tenant, sessionId));
}

} // namespace chunkvault

#include "chunkvault/artifact_store.h"
#include "chunkvault/names.h"
#include "chunkvault/workspace.h"
#include "utilities/digest.hpp"
#include "utilities/logger.h"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

Clock::time_point toSystemTime(fs::file_time_type ft) {
  return std::chrono::time_point_cast<Clock::duration>(
      std::chrono::file_clock::to_sys(ft));
}

class FileArtifactSink : public ArtifactSink {
public:
  explicit FileArtifactSink(fs::path target)
      : target_(std::move(target)),
        temp_(target_.parent_path() /
              ("." + target_.filename().string() + Workspace::kPartialMarker +
               utils::randomHex(8))) {
    std::error_code ec;
    fs::create_directories(target_.parent_path(), ec);
    if (ec)
      throw std::runtime_error("cannot create artifact directory: " +
                               ec.message());
    out_.open(temp_, std::ios::binary | std::ios::trunc);
    if (!out_)
      throw std::runtime_error("cannot create " + temp_.string());
  }

  ~FileArtifactSink() override {
    if (!done_)
      abort();
  }

  void write(std::span<const std::byte> data) override {
    if (done_)
      throw std::logic_error("write after artifact sink finished");
    if (data.empty())
      return;
    out_.write(reinterpret_cast<const char *>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_)
      throw std::runtime_error("write to " + temp_.string() + " failed");
  }

  void commit() override {
    if (done_)
      throw std::logic_error("artifact sink already finished");
    out_.close();
    if (!out_)
      throw std::runtime_error("flush of " + temp_.string() + " failed");
    std::error_code ec;
    fs::rename(temp_, target_, ec);
    if (ec)
      throw std::runtime_error("cannot publish " + target_.string() + ": " +
                               ec.message());
    done_ = true;
  }

  void abort() noexcept override {
    if (done_)
      return;
    done_ = true;
    out_.close();
    std::error_code ec;
    fs::remove(temp_, ec);
  }

private:
  fs::path target_;
  fs::path temp_;
  std::ofstream out_;
  bool done_ = false;
};

} // namespace

ArtifactStore::ArtifactStore(fs::path root) : root_(std::move(root)) {}

fs::path ArtifactStore::artifactPath(const TenantId &tenant,
                                     const std::string &category,
                                     const std::string &filename) const {
  return root_ / encodeKey(tenant) / category / filename;
}

ArtifactStore::NameLease ArtifactStore::lockFor(const TenantId &tenant,
                                                const std::string &category,
                                                const std::string &filename) {
  return nameLocks_.acquire(artifactPath(tenant, category, filename).string());
}

std::unique_ptr<ArtifactSink>
ArtifactStore::openForWrite(const TenantId &tenant, const std::string &category,
                            const std::string &filename) {
  if (!isValidLabel(category) || !isValidLabel(filename))
    throw std::invalid_argument("invalid artifact name " + category + "/" +
                                filename);
  return std::make_unique<FileArtifactSink>(
      artifactPath(tenant, category, filename));
}

std::optional<ArtifactInfo>
ArtifactStore::stat(const TenantId &tenant, const std::string &category,
                    const std::string &filename) const {
  if (!isValidLabel(category) || !isValidLabel(filename))
    return std::nullopt;
  const fs::path path = artifactPath(tenant, category, filename);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return std::nullopt;
  ArtifactInfo info;
  info.category = category;
  info.filename = filename;
  info.size = fs::file_size(path, ec);
  if (ec)
    return std::nullopt;
  const auto mtime = fs::last_write_time(path, ec);
  if (!ec)
    info.modified = toSystemTime(mtime);
  return info;
}

Result<std::uint64_t> ArtifactStore::remove(const TenantId &tenant,
                                            const std::string &category,
                                            const std::string &filename) {
  if (!isValidLabel(category) || !isValidLabel(filename))
    return makeError(ErrorCode::InvalidArgument,
                     "invalid artifact name " + category + "/" + filename);
  const fs::path path = artifactPath(tenant, category, filename);
  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  if (ec == std::errc::no_such_file_or_directory)
    return makeError(ErrorCode::ArtifactNotFound,
                     "no artifact " + category + "/" + filename);
  if (ec)
    return makeError(ErrorCode::StorageIO,
                     "cannot stat " + path.string() + ": " + ec.message());
  const bool removed = fs::remove(path, ec);
  if (ec)
    return makeError(ErrorCode::StorageIO,
                     "cannot remove " + path.string() + ": " + ec.message());
  if (!removed)
    return makeError(ErrorCode::ArtifactNotFound,
                     "no artifact " + category + "/" + filename);
  return static_cast<std::uint64_t>(size);
}

std::vector<ArtifactInfo> ArtifactStore::list(const TenantId &tenant) const {
  std::vector<ArtifactInfo> out;
  std::error_code ec;
  fs::recursive_directory_iterator it(root_ / encodeKey(tenant), ec);
  for (fs::recursive_directory_iterator end; !ec && it != end;
       it.increment(ec)) {
    std::error_code typeEc;
    if (it.depth() != 1 || !it->is_regular_file(typeEc))
      continue;
    const std::string name = it->path().filename().string();
    if (name.front() == '.')
      continue;
    auto info = stat(tenant, it->path().parent_path().filename().string(), name);
    if (info)
      out.push_back(std::move(*info));
  }
  return out;
}

std::uint64_t ArtifactStore::totalBytes(const TenantId &tenant) const {
  std::uint64_t total = 0;
  for (const auto &info : list(tenant))
    total += info.size;
  return total;
}

std::vector<TenantId> ArtifactStore::tenants() const {
  std::vector<TenantId> out;
  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    if (auto tenant = decodeKey(it->path().filename().string()))
      out.push_back(*tenant);
  }
  return out;
}

std::size_t ArtifactStore::removeStaleTemporaries() {
  std::size_t removed = 0;
  std::vector<fs::path> victims;
  std::error_code ec;
  fs::recursive_directory_iterator it(root_, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (!name.empty() && name.front() == '.' && Workspace::isPartialFile(name))
      victims.push_back(it->path());
  }
  for (const auto &path : victims) {
    std::error_code removeEc;
    if (fs::remove(path, removeEc))
      ++removed;
    else if (removeEc)
      Logger::getInstance().log(LogLevel::WARN,
                                "Cannot remove stale artifact temporary",
                                {{"path", path.string()},
                                 {"error", removeEc.message()}});
  }
  return removed;
}

} // namespace chunkvault

#include "chunkvault/checksum.h"
#include "chunkvault/collaborators.h"
#include "chunkvault/config.h"
#include "chunkvault/upload_service.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace chunkvault;

namespace {

int usage() {
  std::cout << "Usage: chunkvault_ctl upload <tenant> <file> [category] "
               "[chunk_bytes]\n"
            << "       chunkvault_ctl status <tenant> <session>\n"
            << "       chunkvault_ctl merge <tenant> <session>\n"
            << "       chunkvault_ctl usage <tenant>\n"
            << "       chunkvault_ctl delete <tenant> <category> <filename>\n"
            << "       chunkvault_ctl sweep|recover|metrics\n";
  return 1;
}

int fail(const Error &error) {
  std::cerr << errorCodeName(error.code) << ": " << error.message << std::endl;
  if (!error.missingIndices.empty()) {
    std::cerr << "missing:";
    for (auto idx : error.missingIndices)
      std::cerr << ' ' << idx;
    std::cerr << std::endl;
  }
  return 2;
}

void printArtifact(const ArtifactInfo &info) {
  std::cout << "category\t" << info.category << '\n'
            << "filename\t" << info.filename << '\n'
            << "size\t" << info.size << '\n';
  if (!info.sha256.empty())
    std::cout << "sha256\t" << info.sha256 << '\n';
}

int uploadCommand(UploadService &service, const std::string &tenant,
                  const std::string &file, const std::string &category,
                  std::uint64_t chunkBytes) {
  namespace fs = std::filesystem;
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    std::cerr << "Cannot open " << file << std::endl;
    return 1;
  }
  if (chunkBytes == 0 || chunkBytes > service.config().maxChunkBytes) {
    std::cerr << "chunk_bytes must be in [1, "
              << service.config().maxChunkBytes << "]" << std::endl;
    return 1;
  }
  const std::uint64_t size = fs::file_size(file);
  const auto total = static_cast<std::uint32_t>(
      size == 0 ? 1 : (size + chunkBytes - 1) / chunkBytes);

  StaticIdentity identity(tenant);
  ChunkUpload upload;
  upload.sessionId = UploadService::newSessionId();
  upload.totalChunks = total;
  upload.filename = fs::path(file).filename().string();
  upload.category = category;
  std::cout << "session\t" << upload.sessionId << std::endl;

  std::vector<char> buffer(chunkBytes);
  for (std::uint32_t i = 0; i < total; ++i) {
    in.read(buffer.data(), static_cast<std::streamsize>(chunkBytes));
    const auto got = static_cast<std::size_t>(in.gcount());
    upload.index = i;
    upload.bytes = std::as_bytes(std::span<const char>(buffer.data(), got));
    upload.checksum = ChecksumVerifier::compute(upload.bytes);
    auto ack = service.beginOrContinueChunk(identity, upload);
    if (!ack)
      return fail(ack.error());
  }

  auto merged = service.merge(identity, upload.sessionId);
  if (!merged)
    return fail(merged.error());
  printArtifact(merged.value());
  return 0;
}

int statusCommand(UploadService &service, const std::string &tenant,
                  const std::string &session) {
  auto status = service.status(StaticIdentity(tenant), session);
  if (!status)
    return fail(status.error());
  const UploadStatus &s = status.value();
  if (!s.exists) {
    std::cout << "No such session" << std::endl;
    return 1;
  }
  std::cout << "filename\t" << s.filename << '\n'
            << "category\t" << s.category << '\n'
            << "received\t" << s.receivedIndices.size() << '/'
            << s.totalChunks << '\n'
            << "progress\t" << s.progress << "%\n"
            << "complete\t" << (s.complete ? "yes" : "no") << std::endl;
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2)
    return usage();
  const std::string cmd = argv[1];

  auto loaded = loadConfigFromEnvironment();
  if (!loaded)
    return fail(loaded.error());
  Config config = std::move(loaded).value();
  setDataDir(config.dataDir);

  try {
    std::filesystem::create_directories(logsDir());
    const std::string logFile = config.logFile.empty()
                                    ? logsDir() + "/chunkvault.log"
                                    : config.logFile;
    Logger::init(logFile, config.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  ConfigQuotaLedger ledger(config);
  try {
    UploadService service(config, ledger);
    // Usage lives in memory; rebuild it from disk before doing anything.
    auto recovered = service.recoverUsage();
    if (!recovered)
      return fail(recovered.error());

    if (cmd == "upload" && argc >= 4) {
      const std::string category = argc >= 5 ? argv[4] : "default";
      const std::uint64_t chunkBytes =
          argc >= 6 ? std::stoull(argv[5]) : 4ULL * 1024 * 1024;
      return uploadCommand(service, argv[2], argv[3], category, chunkBytes);
    } else if (cmd == "status" && argc >= 4) {
      return statusCommand(service, argv[2], argv[3]);
    } else if (cmd == "merge" && argc >= 4) {
      auto merged = service.merge(StaticIdentity(argv[2]), argv[3]);
      if (!merged)
        return fail(merged.error());
      printArtifact(merged.value());
      return 0;
    } else if (cmd == "usage" && argc >= 3) {
      auto used = service.usage(StaticIdentity(argv[2]));
      if (!used)
        return fail(used.error());
      std::cout << "used\t" << used.value().usedBytes << '\n'
                << "quota\t" << used.value().quotaBytes << std::endl;
      return 0;
    } else if (cmd == "delete" && argc >= 5) {
      auto removed =
          service.deleteArtifact(StaticIdentity(argv[2]), argv[3], argv[4]);
      if (!removed)
        return fail(removed.error());
      std::cout << "Deleted " << argv[3] << '/' << argv[4] << std::endl;
      return 0;
    } else if (cmd == "sweep") {
      std::cout << "Swept " << service.sweep() << " sessions" << std::endl;
      return 0;
    } else if (cmd == "recover") {
      std::cout << "Usage recovered" << std::endl;
      return 0;
    } else if (cmd == "metrics") {
      std::cout << MetricsRegistry::instance().toPrometheus();
      return 0;
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::FATAL,
                              std::string("chunkvault_ctl failed: ") +
                                  e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return usage();
}

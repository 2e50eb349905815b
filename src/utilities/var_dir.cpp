#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace chunkvault {

static std::string dataDir = [] {
  const char *env = std::getenv("CHUNKVAULT_DATA_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/lib/chunkvault"))
    return std::string("/var/lib/chunkvault");
  return std::string("var/chunkvault");
}();

void setDataDir(const std::string &dir) { dataDir = dir; }

const std::string &getDataDir() { return dataDir; }

std::string logsDir() { return getDataDir() + "/logs"; }

} // namespace chunkvault

#pragma once

#include <string>

namespace chunkvault {

/// Root directory for all persisted upload state.
void setDataDir(const std::string &dir);
const std::string &getDataDir();

std::string logsDir();

} // namespace chunkvault

#include "utilities/digest.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "chunkvault_test_var";
  chunkvault::setDataDir(base.string());
  fs::create_directories(chunkvault::logsDir());

  // Initialize the logger for tests
  try {
    Logger::init(chunkvault::logsDir() + "/chunkvault_tests.log",
                 LogLevel::DEBUG);
    chunkvault::utils::ensureSodium();
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1; // Exit if logger or libsodium fails to initialize
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

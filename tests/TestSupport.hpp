#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

// Base fixture: every test gets its own scratch directory, named after the
// test so parallel test processes never share one.
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = fs::temp_directory_path() /
               (std::string("organizer_test_") + info->test_suite_name() + "_" +
                info->name());
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    // Ignore errors during cleanup as they are not part of the test result.
  }

  // Creates a file (and its parent directories) below test_dir.
  fs::path CreateFile(const fs::path& relative_path,
                      const std::string& content = "dummy content") {
    fs::path full_path = test_dir / relative_path;
    if (full_path.has_parent_path()) {
      fs::create_directories(full_path.parent_path());
    }
    std::ofstream ofs(full_path, std::ios::binary);
    ofs << content;
    return full_path;
  }

  static std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

  fs::path test_dir;
};

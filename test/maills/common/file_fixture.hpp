#pragma once

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <string>
#include <string_view>

#include "maills/utils/canonical_path.hpp"

namespace maills::test {

// Temporary directory holding the contact files of one test
class FileTestFixture {
 public:
  FileTestFixture() : FileTestFixture("maills_test") {
  }

  explicit FileTestFixture(std::string_view prefix) {
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    // Unique per fixture so sections never see each other's files
    static std::atomic<int> counter{0};
    temp_dir_ = base_temp / (std::string(prefix) + "_" +
                             std::to_string(::getpid()) + "_" +
                             std::to_string(counter++));
    std::filesystem::remove_all(temp_dir_);
    std::filesystem::create_directories(temp_dir_);
  }

  ~FileTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  FileTestFixture(const FileTestFixture&) = delete;
  auto operator=(const FileTestFixture&) -> FileTestFixture& = delete;

  FileTestFixture(FileTestFixture&&) = delete;
  auto operator=(FileTestFixture&&) -> FileTestFixture& = delete;

  [[nodiscard]] auto GetTempDir() const -> CanonicalPath {
    return CanonicalPath(temp_dir_);
  }

  // Creates parent directories as needed
  auto CreateFile(std::string_view filename, std::string_view content)
      -> CanonicalPath {
    auto file_path = temp_dir_ / filename;
    std::filesystem::create_directories(file_path.parent_path());
    std::ofstream file(file_path, std::ios::binary);
    file << content;
    file.close();
    return CanonicalPath(file_path);
  }

  auto RemoveFile(std::string_view filename) -> void {
    std::error_code ec;
    std::filesystem::remove(temp_dir_ / filename, ec);
  }

 private:
  std::filesystem::path temp_dir_;
};

}  // namespace maills::test

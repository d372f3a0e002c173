#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace portico::test {

// Unique directory under the system temp directory, removed recursively on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "portico-test-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Writes 'content' to a file named 'filename' inside the directory and returns its full path.
  std::string writeFile(std::string_view filename, std::string_view content) const;

 private:
  std::filesystem::path _dir;
};

}  // namespace portico::test

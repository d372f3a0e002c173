#include "portico/temp-file.hpp"

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "portico/log.hpp"

namespace portico::test {

namespace {
std::atomic<unsigned> gDirCounter{0};
}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / fmt::format("{}{}-{}", prefix, ::getpid(), gDirCounter.fetch_add(1));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      _dir = std::move(candidate);
      return;
    }
  }
  throw std::runtime_error("Unable to create a temporary directory");
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::warn("Unable to remove temporary directory {}: {}", _dir.string(), ec.message());
  }
}

std::string ScopedTempDir::writeFile(std::string_view filename, std::string_view content) const {
  const auto path = _dir / filename;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    throw std::runtime_error(fmt::format("Unable to write temporary file {}", path.string()));
  }
  return path.string();
}

}  // namespace portico::test

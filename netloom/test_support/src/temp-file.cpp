#include "netloom/temp-file.hpp"

#include <spdlog/fmt/fmt.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "netloom/log.hpp"

namespace netloom::test {

namespace {
std::string UniqueSuffix() {
  static std::atomic<unsigned> gCounter{0};
  return fmt::format("{}-{}", ::getpid(), gCounter.fetch_add(1));
}
}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / (std::string(prefix) + UniqueSuffix());
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      _dir = std::move(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::error("ScopedTempDir: unable to remove {}: {}", _dir.string(), ec.message());
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view content, std::string_view name)
    : _path(dir.dirPath() / (name.empty() ? "netloom_temp_" + UniqueSuffix() : std::string(name))),
      _content(content) {
  std::filesystem::create_directories(_path.parent_path());
  std::ofstream out(_path, std::ios::binary | std::ios::trunc);
  out.write(_content.data(), static_cast<std::streamsize>(_content.size()));
  if (!out) {
    throw std::system_error(errno, std::generic_category(), "ScopedTempFile: unable to write " + _path.string());
  }
}

ScopedTempFile::~ScopedTempFile() {
  std::error_code ec;
  std::filesystem::remove(_path, ec);
}

}  // namespace netloom::test

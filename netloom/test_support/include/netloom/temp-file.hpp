#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace netloom::test {

// Creates a unique temporary directory under the system temp directory and removes it
// (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "netloom-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&&) = delete;
  ScopedTempDir& operator=(ScopedTempDir&&) = delete;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  std::filesystem::path _dir;
};

// Creates a file with given content inside a ScopedTempDir, removed on destruction.
// With an empty name, a unique name is generated.
// The name may contain sub directories ("css/site.css"); they are created as needed.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content, std::string_view name = {});

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&&) = delete;
  ScopedTempFile& operator=(ScopedTempFile&&) = delete;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] std::string filename() const { return _path.filename().string(); }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  std::filesystem::path _path;
  std::string _content;
};

}  // namespace netloom::test

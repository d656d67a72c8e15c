#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace outflow::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "outflow-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: a file created inside an existing ScopedTempDir and removed on destruction.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  // Create a file of the given size filled with a pseudo-random (but deterministic per seed) byte
  // pattern. The full content is kept in memory and can be retrieved with content().
  ScopedTempFile(const ScopedTempDir& dir, std::uint64_t size, std::uint64_t seed = 0);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void create(const ScopedTempDir& dir);
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

// Read the whole content of a file, throws std::runtime_error if it cannot be opened.
std::string ReadFileContent(const std::filesystem::path& path);

}  // namespace outflow::test

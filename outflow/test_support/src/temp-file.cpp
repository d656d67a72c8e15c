#include "outflow/temp-file.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "outflow/base-fd.hpp"
#include "outflow/log.hpp"

namespace outflow::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64 &threadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view content) : _content(content) {
  create(dir);
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::uint64_t size, std::uint64_t seed) {
  std::mt19937_64 gen(seed);
  _content.resize(size);
  for (char &ch : _content) {
    ch = static_cast<char>(gen() & 0xFF);
  }
  create(dir);
}

void ScopedTempFile::create(const ScopedTempDir &dir) {
  // mkstemp gives an atomic create+open, no race with concurrent tests.
  std::string tmpl = dir.dirPath().string() + "/outflow_temp_XXXXXX";

  BaseFd raii(::mkstemp(tmpl.data()));
  if (!raii) {
    throw std::system_error(errno, std::generic_category(), "ScopedTempFile: mkstemp failed");
  }
  _path = std::filesystem::path(tmpl);

  std::string_view remaining(_content);
  while (!remaining.empty()) {
    const auto written = ::write(raii.fd(), remaining.data(), remaining.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int err = errno;
      cleanup();
      throw std::system_error(err, std::generic_category(), "ScopedTempFile: write failed");
    }
    remaining.remove_prefix(static_cast<std::size_t>(written));
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile &&other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile &ScopedTempFile::operator=(ScopedTempFile &&other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  // Only the file, ScopedTempDir owns its directory.
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if (ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {}", _path.string(), ec.message());
    }
    _path.clear();
  }
}

std::string ReadFileContent(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("ReadFileContent: unable to open " + path.string());
  }
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

}  // namespace outflow::test

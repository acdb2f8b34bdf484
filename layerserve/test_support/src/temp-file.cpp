#include "layerserve/temp-file.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <ios>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "layerserve/errno-throw.hpp"
#include "layerserve/log.hpp"

namespace layerserve::test {

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

std::filesystem::path ScopedTempDir::writeFile(std::string_view relativePath, std::string_view content) const {
  const auto path = _dir / relativePath;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw std::runtime_error("ScopedTempDir: write failed for " + path.string());
  }
  return path;
}

std::filesystem::path ScopedTempDir::makeDir(std::string_view relativePath) const {
  const auto path = _dir / relativePath;
  std::filesystem::create_directories(path);
  return path;
}

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir: unable to remove '{}': {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

bool SetLastModified(const std::filesystem::path &path, std::chrono::sys_seconds tp) {
  const auto secs = tp.time_since_epoch().count();
  std::array<struct timespec, 2> times{};
  times[0].tv_nsec = UTIME_OMIT;
  times[1].tv_sec = static_cast<time_t>(secs);
  times[1].tv_nsec = 0;
  if (::utimensat(AT_FDCWD, path.c_str(), times.data(), 0) != 0) {
    ThrowErrno("utimensat failed for ", path.string());
  }
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    ThrowErrno("stat failed for ", path.string());
  }
  return st.st_mtim.tv_sec == static_cast<time_t>(secs);
}

void SetLastModified(const std::filesystem::path &path, SysTimePoint tp) {
  if (!SetLastModified(path, std::chrono::floor<std::chrono::seconds>(tp))) {
    log::warn("File system did not store the requested modification time of '{}'", path.string());
  }
}

}  // namespace layerserve::test

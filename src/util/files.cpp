#include "util/files.hpp"
#include <cstdio>
#include <fstream>
#include <random>
#include <fcntl.h>
#include <unistd.h>

namespace lightwallet {
namespace util {

namespace {

// Snapshots larger than this are refused on read
constexpr std::streamsize MAX_FILE_SIZE = 256 * 1024 * 1024;

bool sync_directory(const std::filesystem::path &dir) {
#if defined(__linux__)
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#else
  int fd = open(dir.c_str(), O_RDONLY);
#endif
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

// Write the whole buffer, retrying on short writes
bool write_all(int fd, const std::string &data) {
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      return false;
    }
    total += static_cast<size_t>(n);
  }
  return true;
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  std::error_code ec;
  if (!write_all(fd, data) || fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return std::nullopt;
  }

  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size < 0 || size > MAX_FILE_SIZE) {
    return std::nullopt;
  }

  std::string data(static_cast<size_t>(size), '\0');
  file.seekg(0);
  file.read(data.data(), size);
  if (!file) {
    return std::nullopt;
  }

  return data;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

} // namespace util
} // namespace lightwallet

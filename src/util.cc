#include "util.h"

#include <array>
#include <cerrno>
#include <iterator>
#include <system_error>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace bitkv {

namespace {

std::array<std::uint32_t, 256> MakeCrcTable() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (0xEDB88320u ^ (c >> 1u)) : (c >> 1u);
    }
    table[i] = c;
  }
  return table;
}

}  // namespace

std::optional<std::uint64_t> FileSize(const std::filesystem::path& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) return std::nullopt;
  return size;
}

Status ReadFileToString(const std::filesystem::path& path, std::string& out) {
  out.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return Status::OK();
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) return Status::IOError("open for read failed: " + path.string());
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) return Status::IOError("read failed: " + path.string());
  return Status::OK();
}

Status ReplaceFile(const std::filesystem::path& path, std::string_view contents, bool sync) {
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return Status::IOError("open failed: " + tmp.string());
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) return Status::IOError("write failed: " + tmp.string());
  }
  if (sync) {
    Status s = SyncFileToDisk(tmp);
    if (!s.ok()) return s;
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) return Status::IOError("rename " + tmp.string() + " failed: " + ec.message());
  if (sync) return SyncParentDir(path);
  return Status::OK();
}

Status SyncFileToDisk(const std::filesystem::path& path) {
#ifdef _WIN32
  int fd = _open(path.string().c_str(), _O_BINARY | _O_RDWR);
  if (fd < 0) return Status::IOError("open for sync failed: " + path.string());
  int rc = _commit(fd);
  _close(fd);
  if (rc != 0) return Status::IOError("fsync failed: " + path.string());
#else
  int fd = ::open(path.c_str(), O_RDWR);
  if (fd < 0) return Status::IOError("open for sync failed: " + path.string());
  int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) return Status::IOError("fsync failed: " + path.string());
#endif
  return Status::OK();
}

Status SyncParentDir(const std::filesystem::path& path) {
#ifdef _WIN32
  (void)path;
  return Status::OK();
#else
  auto dir = path.parent_path();
  if (dir.empty()) dir = ".";
  int fd = ::open(dir.c_str(), O_RDONLY);
  if (fd < 0) return Status::IOError("open dir for sync failed: " + dir.string());
  int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) return Status::IOError("fsync dir failed: " + dir.string());
  return Status::OK();
#endif
}

std::uint32_t CRC32(std::string_view data) {
  static const auto kTable = MakeCrcTable();
  std::uint32_t crc = 0xFFFFFFFFu;
  for (unsigned char ch : data) {
    crc = kTable[(crc ^ ch) & 0xFFu] ^ (crc >> 8u);
  }
  return crc ^ 0xFFFFFFFFu;
}

}  // namespace bitkv

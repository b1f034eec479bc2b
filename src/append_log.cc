#include "append_log.h"

#include <utility>

#include "util.h"

namespace bitkv {

AppendLog::AppendLog(std::filesystem::path path, std::uint32_t segment_id)
    : path_(std::move(path)), segment_id_(segment_id) {}

AppendLog::~AppendLog() { out_.close(); }

Status AppendLog::Open() {
  std::lock_guard lock(mu_);
  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  out_.open(path_, std::ios::binary | std::ios::app);
  if (!out_.is_open()) {
    return Status::IOError("failed to open segment: " + path_.string());
  }
  auto size = FileSize(path_);
  if (!size) return Status::IOError("failed to stat segment: " + path_.string());
  next_offset_ = *size;
  return Status::OK();
}

Status AppendLog::Append(std::string_view data, bool sync, std::uint64_t& offset, std::uint64_t& length) {
  std::lock_guard lock(mu_);
  if (!out_.is_open()) return Status::IOError("segment not open");

  out_.write(data.data(), static_cast<std::streamsize>(data.size()));
  out_.flush();
  if (!out_) {
    Status s = Status::IOError("failed to append to segment: " + path_.string());
    Status r = RollbackPartialAppend();
    if (!r.ok()) return Status::IOError(s.message() + "; " + r.message());
    return s;
  }
  offset = next_offset_;
  length = data.size();
  next_offset_ += data.size();

  if (sync) return SyncFileToDisk(path_);
  return Status::OK();
}

// Drops whatever a failed append left buffered or half-written, so the file
// ends at next_offset_ again. Caller holds mu_.
Status AppendLog::RollbackPartialAppend() {
  out_.clear();
  out_.close();
  std::error_code ec;
  std::filesystem::resize_file(path_, next_offset_, ec);
  out_.open(path_, std::ios::binary | std::ios::app);
  if (!out_.is_open()) return Status::IOError("failed to reopen segment: " + path_.string());
  if (ec) {
    // Truncation failed: keep appending after whatever is on disk.
    auto size = FileSize(path_);
    if (!size) return Status::IOError("failed to stat segment: " + path_.string());
    next_offset_ = *size;
    return Status::IOError("truncate after failed append: " + ec.message());
  }
  return Status::OK();
}

Status AppendLog::Read(std::uint64_t offset, std::uint64_t length, std::string& out) const {
  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) return Status::IOError("segment missing: " + path_.string());
  in.seekg(static_cast<std::streamoff>(offset));
  if (!in) return Status::IOError("seek failed at " + std::to_string(offset));

  out.assign(length, '\0');
  if (length == 0) return Status::OK();
  if (!in.read(out.data(), static_cast<std::streamsize>(length))) {
    return Status::IOError("short read at " + std::to_string(offset) + " (wanted " + std::to_string(length) +
                           ", got " + std::to_string(in.gcount()) + ")");
  }
  return Status::OK();
}

Status AppendLog::Erase(std::uint64_t offset, std::uint64_t length, char filler) {
  if (length == 0) return Status::OK();
  auto size = FileSize(path_);
  if (!size) return Status::IOError("segment missing: " + path_.string());
  if (offset + length > *size) {
    return Status::IOError("erase range " + std::to_string(offset) + "+" + std::to_string(length) +
                           " beyond segment end " + std::to_string(*size));
  }

  std::fstream f(path_, std::ios::binary | std::ios::in | std::ios::out);
  if (!f.is_open()) return Status::IOError("open for erase failed: " + path_.string());
  f.seekp(static_cast<std::streamoff>(offset));
  const std::string fill(length, filler);
  f.write(fill.data(), static_cast<std::streamsize>(fill.size()));
  f.flush();
  if (!f) return Status::IOError("erase write failed at " + std::to_string(offset));
  return Status::OK();
}

Status AppendLog::Sync() {
  std::lock_guard lock(mu_);
  if (!out_.is_open()) return Status::OK();
  out_.flush();
  return SyncFileToDisk(path_);
}

std::uint64_t AppendLog::Size() const {
  std::lock_guard lock(mu_);
  return next_offset_;
}

}  // namespace bitkv

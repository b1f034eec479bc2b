#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "bitkv/status.h"

namespace bitkv {

// The single growing data segment. Appends are serialized by an internal
// mutex; reads and erases open their own file handles.
class AppendLog {
 public:
  AppendLog(std::filesystem::path path, std::uint32_t segment_id);
  ~AppendLog();

  // Creates the segment if missing and positions the writer at its end.
  Status Open();
  Status Append(std::string_view data, bool sync, std::uint64_t& offset, std::uint64_t& length);
  // IOError when the segment is missing or shorter than offset + length.
  Status Read(std::uint64_t offset, std::uint64_t length, std::string& out) const;
  // Overwrites the range with filler. The file is never shrunk.
  Status Erase(std::uint64_t offset, std::uint64_t length, char filler);
  Status Sync();

  [[nodiscard]] std::uint64_t Size() const;
  [[nodiscard]] std::uint32_t segment_id() const { return segment_id_; }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  Status RollbackPartialAppend();

  std::filesystem::path path_;
  std::uint32_t segment_id_;
  std::ofstream out_;
  mutable std::mutex mu_;
  std::uint64_t next_offset_{0};
};

}  // namespace bitkv

#pragma once

#include <cstdint>
#include <filesystem>

#include "bitkv/status.h"

namespace bitkv {

// Stored as {"db_file_size": <KiB>, "db_file_offset": <bytes>}.
struct SegmentMeta {
  static constexpr std::uint64_t kSizeUnit = 1024;

  std::uint64_t file_size{0};    // bytes
  std::uint64_t file_offset{0};  // next write position

  // Missing or empty file yields the default (zeroed) metadata.
  Status LoadFromFile(const std::filesystem::path& path);
  Status SaveToFile(const std::filesystem::path& path, bool sync) const;
};

}  // namespace bitkv

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "bitkv/status.h"

namespace bitkv {

inline void AppendU32(std::string& buf, std::uint32_t v) {
  buf.push_back(static_cast<char>(v & 0xFFu));
  buf.push_back(static_cast<char>((v >> 8u) & 0xFFu));
  buf.push_back(static_cast<char>((v >> 16u) & 0xFFu));
  buf.push_back(static_cast<char>((v >> 24u) & 0xFFu));
}

inline void AppendU64(std::string& buf, std::uint64_t v) {
  for (int i = 0; i < 8; ++i) buf.push_back(static_cast<char>((v >> (i * 8)) & 0xFFu));
}

// Decoders consume from the front of `in` and fail when it is too short.
inline bool ConsumeU32(std::string_view& in, std::uint32_t& value) {
  if (in.size() < 4) return false;
  const auto* p = reinterpret_cast<const unsigned char*>(in.data());
  value = static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8u) |
          (static_cast<std::uint32_t>(p[2]) << 16u) | (static_cast<std::uint32_t>(p[3]) << 24u);
  in.remove_prefix(4);
  return true;
}

inline bool ConsumeU64(std::string_view& in, std::uint64_t& value) {
  if (in.size() < 8) return false;
  const auto* p = reinterpret_cast<const unsigned char*>(in.data());
  value = 0;
  for (int i = 7; i >= 0; --i) {
    value <<= 8u;
    value |= static_cast<std::uint64_t>(p[i]);
  }
  in.remove_prefix(8);
  return true;
}

std::optional<std::uint64_t> FileSize(const std::filesystem::path& path);
// Missing file reads as empty.
Status ReadFileToString(const std::filesystem::path& path, std::string& out);
// Writes contents to <path>.tmp and renames it over path.
Status ReplaceFile(const std::filesystem::path& path, std::string_view contents, bool sync);
Status SyncFileToDisk(const std::filesystem::path& path);
Status SyncParentDir(const std::filesystem::path& path);
std::uint32_t CRC32(std::string_view data);

}  // namespace bitkv

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "bitkv/status.h"
#include "location.h"

namespace bitkv {

// Authoritative key -> location mapping. Not synchronized; the engine lock
// guards it.
class KeyIndex {
 public:
  static constexpr std::uint32_t kMagic = 0x58494B42u;  // "BKIX"
  static constexpr std::uint32_t kVersion = 1;

  void Put(std::string key, const LocationRecord& record) { map_[std::move(key)] = record; }
  bool Get(std::string_view key, LocationRecord& record) const;
  bool Remove(std::string_view key, LocationRecord& removed);
  void ForEach(const std::function<void(const std::string&, const LocationRecord&)>& fn) const;
  [[nodiscard]] std::size_t Size() const { return map_.size(); }
  void Clear() { map_.clear(); }

  // Missing or empty file -> empty index. Framing or checksum errors -> Corruption.
  Status LoadFromFile(const std::filesystem::path& path);
  Status SaveToFile(const std::filesystem::path& path, bool sync) const;

  [[nodiscard]] std::string Encode() const;
  Status Decode(std::string_view data);

 private:
  std::unordered_map<std::string, LocationRecord> map_;
};

}  // namespace bitkv

#include "key_index.h"

#include <utility>

#include "util.h"

namespace bitkv {

bool KeyIndex::Get(std::string_view key, LocationRecord& record) const {
  auto it = map_.find(std::string(key));
  if (it == map_.end()) return false;
  record = it->second;
  return true;
}

bool KeyIndex::Remove(std::string_view key, LocationRecord& removed) {
  auto it = map_.find(std::string(key));
  if (it == map_.end()) return false;
  removed = it->second;
  map_.erase(it);
  return true;
}

void KeyIndex::ForEach(const std::function<void(const std::string&, const LocationRecord&)>& fn) const {
  for (const auto& kv : map_) fn(kv.first, kv.second);
}

// on disk: [magic:4][version:4][count:8] count*[klen:4][key][segment:4][offset:8][length:8] [crc32]
std::string KeyIndex::Encode() const {
  std::string buf;
  AppendU32(buf, kMagic);
  AppendU32(buf, kVersion);
  AppendU64(buf, static_cast<std::uint64_t>(map_.size()));
  for (const auto& [key, rec] : map_) {
    AppendU32(buf, static_cast<std::uint32_t>(key.size()));
    buf.append(key);
    AppendU32(buf, rec.segment_id);
    AppendU64(buf, rec.offset);
    AppendU64(buf, rec.length);
  }
  AppendU32(buf, CRC32(buf));
  return buf;
}

Status KeyIndex::Decode(std::string_view data) {
  if (data.size() < 4) return Status::Corruption("key index too short");
  std::string_view body = data.substr(0, data.size() - 4);
  std::string_view tail = data.substr(data.size() - 4);
  std::uint32_t stored_crc = 0;
  ConsumeU32(tail, stored_crc);
  if (CRC32(body) != stored_crc) return Status::Corruption("key index checksum mismatch");

  std::uint32_t magic = 0;
  std::uint32_t version = 0;
  std::uint64_t count = 0;
  if (!ConsumeU32(body, magic) || magic != kMagic) return Status::Corruption("bad key index magic");
  if (!ConsumeU32(body, version) || version != kVersion) {
    return Status::Corruption("unsupported key index version");
  }
  if (!ConsumeU64(body, count)) return Status::Corruption("truncated key index header");

  std::unordered_map<std::string, LocationRecord> loaded;
  for (std::uint64_t i = 0; i < count; ++i) {
    std::uint32_t key_size = 0;
    if (!ConsumeU32(body, key_size) || body.size() < key_size) {
      return Status::Corruption("truncated key index entry " + std::to_string(i));
    }
    std::string key(body.substr(0, key_size));
    body.remove_prefix(key_size);
    LocationRecord rec;
    if (!ConsumeU32(body, rec.segment_id) || !ConsumeU64(body, rec.offset) || !ConsumeU64(body, rec.length)) {
      return Status::Corruption("truncated key index entry " + std::to_string(i));
    }
    loaded[std::move(key)] = rec;
  }
  if (!body.empty()) return Status::Corruption("trailing bytes in key index");
  map_ = std::move(loaded);
  return Status::OK();
}

Status KeyIndex::LoadFromFile(const std::filesystem::path& path) {
  std::string contents;
  Status s = ReadFileToString(path, contents);
  if (!s.ok()) return s;
  if (contents.empty()) {
    map_.clear();
    return Status::OK();
  }
  s = Decode(contents);
  if (!s.ok()) return Status::Corruption(path.string() + ": " + s.message());
  return Status::OK();
}

Status KeyIndex::SaveToFile(const std::filesystem::path& path, bool sync) const {
  return ReplaceFile(path, Encode(), sync);
}

}  // namespace bitkv

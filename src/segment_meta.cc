#include "segment_meta.h"

#include <string>

#include <nlohmann/json.hpp>

#include "util.h"

namespace bitkv {

using json = nlohmann::json;

Status SegmentMeta::LoadFromFile(const std::filesystem::path& path) {
  std::string contents;
  Status s = ReadFileToString(path, contents);
  if (!s.ok()) return s;
  if (contents.find_first_not_of(" \t\r\n") == std::string::npos) {
    *this = SegmentMeta{};
    return Status::OK();
  }

  try {
    const json j = json::parse(contents);
    const auto size_units = j.at("db_file_size").get<std::uint64_t>();
    file_offset = j.at("db_file_offset").get<std::uint64_t>();
    file_size = size_units * kSizeUnit;
  } catch (const json::exception& e) {
    return Status::Corruption(path.string() + ": " + e.what());
  }
  return Status::OK();
}

Status SegmentMeta::SaveToFile(const std::filesystem::path& path, bool sync) const {
  json j;
  j["db_file_size"] = file_size / kSizeUnit;
  j["db_file_offset"] = file_offset;
  return ReplaceFile(path, j.dump(), sync);
}

}  // namespace bitkv

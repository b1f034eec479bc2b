#include "location_set.h"

#include <mutex>
#include <string_view>
#include <vector>

#include "util.h"

namespace bitkv {

void LocationSet::Insert(const LocationRecord& record) {
  auto key = record.ToString();
  std::unique_lock lock(mu_);
  tree_.Insert(key);
  inserted_.insert(std::move(key));
}

Status LocationSet::Search(const LocationRecord& record, LocationRecord& found) const {
  const auto key = record.ToString();
  RadixTree::MatchResult match;
  {
    std::shared_lock lock(mu_);
    match = tree_.Match(key);
  }
  for (const std::string* fragment : {&match.common, &match.remaining_prefix, &match.remaining_word}) {
    if (fragment->empty()) continue;
    LocationRecord candidate;
    Status s = ParseLocation(*fragment, candidate);
    if (!s.ok()) return s;
    if (SameSegmentAndLength(record, candidate)) {
      found = candidate;
      return Status::OK();
    }
  }
  return Status::NotFound(key);
}

bool LocationSet::Delete(const LocationRecord& record) {
  const auto key = record.ToString();
  std::unique_lock lock(mu_);
  if (!tree_.Find(key)) return false;
  tree_.Delete(key);
  inserted_.erase(key);
  return true;
}

bool LocationSet::Contains(const LocationRecord& record) const {
  const auto key = record.ToString();
  std::shared_lock lock(mu_);
  return tree_.Find(key);
}

std::size_t LocationSet::Size() const {
  std::shared_lock lock(mu_);
  return tree_.Size();
}

Status LocationSet::LoadFromFile(const std::filesystem::path& path) {
  std::string contents;
  Status s = ReadFileToString(path, contents);
  if (!s.ok()) return s;

  std::vector<LocationRecord> records;
  std::string_view rest(contents);
  while (!rest.empty()) {
    const auto pos = rest.find_first_of(",\n");
    auto field = rest.substr(0, pos);
    rest.remove_prefix(pos == std::string_view::npos ? rest.size() : pos + 1);
    while (!field.empty() && (field.back() == '\r' || field.back() == ' ')) field.remove_suffix(1);
    while (!field.empty() && field.front() == ' ') field.remove_prefix(1);
    if (field.empty()) continue;
    LocationRecord rec;
    s = ParseLocation(field, rec);
    if (!s.ok()) return Status::Corruption(path.string() + ": " + s.message());
    records.push_back(rec);
  }

  std::unique_lock lock(mu_);
  tree_.Clear();
  inserted_.clear();
  for (const auto& rec : records) {
    auto key = rec.ToString();
    tree_.Insert(key);
    inserted_.insert(std::move(key));
  }
  return Status::OK();
}

Status LocationSet::SaveToFile(const std::filesystem::path& path, bool sync) const {
  std::string buf;
  {
    std::shared_lock lock(mu_);
    std::size_t written = 0;
    for (const auto& item : inserted_) {
      buf.append(item);
      buf.push_back(',');
      if (++written % kRecordsPerLine == 0) buf.push_back('\n');
    }
  }
  return ReplaceFile(path, buf, sync);
}

}  // namespace bitkv

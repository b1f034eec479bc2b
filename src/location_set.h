#pragma once

#include <cstddef>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_set>

#include "bitkv/status.h"
#include "location.h"
#include "radix_tree.h"

namespace bitkv {

// Set of live location records, stored in serialized form in a radix tree and
// persisted as comma separated records.
class LocationSet {
 public:
  static constexpr std::size_t kRecordsPerLine = 40;

  void Insert(const LocationRecord& record);
  // Coarse liveness check: the serialized query is matched at the tree root and
  // every non-empty fragment is parsed and compared with SameSegmentAndLength.
  // NotFound when no fragment qualifies, Corruption when one does not parse.
  Status Search(const LocationRecord& record, LocationRecord& found) const;
  // Returns false when the record was not present.
  bool Delete(const LocationRecord& record);
  [[nodiscard]] bool Contains(const LocationRecord& record) const;
  [[nodiscard]] std::size_t Size() const;

  // A missing or empty file leaves the set empty.
  Status LoadFromFile(const std::filesystem::path& path);
  Status SaveToFile(const std::filesystem::path& path, bool sync) const;

 private:
  mutable std::shared_mutex mu_;
  RadixTree tree_;
  // Serialized records, iterated when saving.
  std::unordered_set<std::string> inserted_;
};

}  // namespace bitkv

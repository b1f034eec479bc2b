#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "bitkv/status.h"

namespace bitkv {

// A contiguous byte range inside one data segment.
struct LocationRecord {
  std::uint32_t segment_id{0};
  std::uint64_t offset{0};
  std::uint64_t length{0};

  // "segment:offset:length"
  [[nodiscard]] std::string ToString() const;

  bool operator==(const LocationRecord& other) const {
    return segment_id == other.segment_id && offset == other.offset && length == other.length;
  }
  bool operator!=(const LocationRecord& other) const { return !(*this == other); }
};

// Legacy comparison used by location set lookups: the offset is not compared,
// so two values of equal size in the same segment compare equal.
inline bool SameSegmentAndLength(const LocationRecord& a, const LocationRecord& b) {
  return a.segment_id == b.segment_id && a.length == b.length;
}

// Corruption unless text is exactly three unsigned decimal fields.
Status ParseLocation(std::string_view text, LocationRecord& out);

}  // namespace bitkv

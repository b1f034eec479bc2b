#include "location.h"

#include <charconv>
#include <system_error>

namespace bitkv {

namespace {

template <typename T>
bool ParseField(std::string_view field, T& out) {
  if (field.empty()) return false;
  const char* first = field.data();
  const char* last = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

}  // namespace

std::string LocationRecord::ToString() const {
  return std::to_string(segment_id) + ":" + std::to_string(offset) + ":" + std::to_string(length);
}

Status ParseLocation(std::string_view text, LocationRecord& out) {
  const auto first = text.find(':');
  if (first == std::string_view::npos) return Status::Corruption("bad location record: " + std::string(text));
  const auto second = text.find(':', first + 1);
  if (second == std::string_view::npos) return Status::Corruption("bad location record: " + std::string(text));

  LocationRecord rec;
  if (!ParseField(text.substr(0, first), rec.segment_id) ||
      !ParseField(text.substr(first + 1, second - first - 1), rec.offset) ||
      !ParseField(text.substr(second + 1), rec.length)) {
    return Status::Corruption("bad location record: " + std::string(text));
  }
  out = rec;
  return Status::OK();
}

}  // namespace bitkv

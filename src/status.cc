#include "bitkv/status.h"

namespace bitkv {

std::string Status::ToString() const {
  switch (code_) {
    case Code::kOk:
      return "OK";
    case Code::kNotFound:
      return "NotFound: " + message_;
    case Code::kIOError:
      return "IOError: " + message_;
    case Code::kInvalidArgument:
      return "InvalidArgument: " + message_;
    case Code::kCorruption:
      return "Corruption: " + message_;
  }
  return "Unknown(" + std::to_string(static_cast<int>(code_)) + "): " + message_;
}

}  // namespace bitkv

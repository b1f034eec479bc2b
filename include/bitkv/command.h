#pragma once

#include <string>
#include <string_view>

#include "bitkv/status.h"

namespace bitkv {

class DB;

struct Command {
  enum class Type { kSet, kGet, kDelete };
  Type type{Type::kGet};
  std::string key;
  std::string value;
};

// Parses "SET <key> <value>", "GET <key>" or "DELETE <key>". Tokens are
// separated by spaces, the verb is case-insensitive, and surrounding
// whitespace (including the line terminator) is ignored.
Status ParseCommand(std::string_view line, Command& cmd);

// Runs one command line against db and renders the reply line: "OK", the raw
// value, or "Error: <reason>". Never throws.
std::string ExecuteCommand(DB& db, std::string_view line);

}  // namespace bitkv

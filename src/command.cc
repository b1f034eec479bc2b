#include "bitkv/command.h"

#include <cctype>
#include <utility>
#include <vector>

#include "bitkv/db.h"

namespace bitkv {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> SplitSpaces(std::string_view s) {
  std::vector<std::string_view> parts;
  while (!s.empty()) {
    const auto pos = s.find(' ');
    auto token = s.substr(0, pos);
    if (!token.empty()) parts.push_back(token);
    if (pos == std::string_view::npos) break;
    s.remove_prefix(pos + 1);
  }
  return parts;
}

std::string ToUpper(std::string_view s) {
  std::string out(s);
  for (auto& ch : out) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  return out;
}

}  // namespace

Status ParseCommand(std::string_view line, Command& cmd) {
  const auto parts = SplitSpaces(Trim(line));
  if (parts.empty()) return Status::InvalidArgument("Invalid command");

  const auto verb = ToUpper(parts[0]);
  const auto argc = parts.size() - 1;
  if (verb == "SET") {
    if (argc != 2) return Status::InvalidArgument("SET command : SET <key> <value>");
    cmd.type = Command::Type::kSet;
    cmd.key.assign(parts[1]);
    cmd.value.assign(parts[2]);
  } else if (verb == "GET") {
    if (argc != 1) return Status::InvalidArgument("GET command: GET <key>");
    cmd.type = Command::Type::kGet;
    cmd.key.assign(parts[1]);
    cmd.value.clear();
  } else if (verb == "DELETE") {
    if (argc != 1) return Status::InvalidArgument("DELETE command : DELETE <key>");
    cmd.type = Command::Type::kDelete;
    cmd.key.assign(parts[1]);
    cmd.value.clear();
  } else {
    return Status::InvalidArgument("Invalid command");
  }
  return Status::OK();
}

std::string ExecuteCommand(DB& db, std::string_view line) {
  Command cmd;
  Status s = ParseCommand(line, cmd);
  if (!s.ok()) return "Error: " + s.message() + "\n";

  switch (cmd.type) {
    case Command::Type::kSet:
      s = db.Put(WriteOptions{}, std::move(cmd.key), std::move(cmd.value));
      break;
    case Command::Type::kGet: {
      std::string value;
      s = db.Get(ReadOptions{}, cmd.key, value);
      if (s.ok()) return value + "\n";
      if (s.IsNotFound()) return "Error: Key not found\n";
      break;
    }
    case Command::Type::kDelete:
      s = db.Delete(WriteOptions{}, std::move(cmd.key));
      break;
  }
  if (!s.ok()) return "Error: " + s.ToString() + "\n";
  return "OK\n";
}

}  // namespace bitkv

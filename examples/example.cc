#include <iostream>
#include <string>

#include "bitkv/command.h"
#include "bitkv/db.h"

int main() {
  bitkv::Options opts;
  opts.data_dir = "bitkv-example-data";
  opts.checkpoint_interval_ms = 60 * 1000;

  std::unique_ptr<bitkv::DB> db;
  bitkv::Status s = bitkv::DB::Open(opts, db);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  bitkv::WriteOptions wopts;
  bitkv::ReadOptions ropts;

  // Put a few keys; "a", "ab" and "abc" share prefixes but not locations.
  for (const auto& [key, value] : {std::pair<const char*, const char*>{"a", "1"}, {"ab", "2"}, {"abc", "3"}}) {
    s = db->Put(wopts, key, value);
    if (!s.ok()) {
      std::cerr << "Put " << key << " failed: " << s.ToString() << "\n";
      return 1;
    }
  }

  std::string value;
  s = db->Get(ropts, "ab", value);
  if (s.ok()) {
    std::cout << "ab=" << value << "\n";
  } else {
    std::cout << "ab not found: " << s.ToString() << "\n";
  }

  // Delete and let the background worker scrub the bytes.
  db->Delete(wopts, "a");
  db->WaitForErasures();
  s = db->Get(ropts, "a", value);
  std::cout << "a after delete: " << s.ToString() << "\n";

  // The text protocol on top of the same engine.
  for (const char* line : {"SET greeting hello", "GET greeting", "DELETE greeting", "GET greeting", "BOGUS"}) {
    std::cout << "> " << line << "\n" << bitkv::ExecuteCommand(*db, line);
  }

  bitkv::Metrics m = db->GetMetrics();
  std::cout << "Metrics: puts=" << m.puts << ", gets=" << m.gets << ", deletes=" << m.deletes
            << ", erasures=" << m.erasures << ", bytes_appended=" << m.bytes_appended << "\n";

  s = db->Close();
  if (!s.ok()) {
    std::cerr << "Close failed: " << s.ToString() << "\n";
    return 1;
  }
  return 0;
}

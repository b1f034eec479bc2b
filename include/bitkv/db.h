#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "bitkv/options.h"
#include "bitkv/status.h"

namespace bitkv {

struct Metrics {
  std::uint64_t puts{0};
  std::uint64_t put_failures{0};
  std::uint64_t deletes{0};
  std::uint64_t gets{0};
  std::uint64_t get_misses{0};
  std::uint64_t bytes_appended{0};

  std::uint64_t erasures{0};
  std::uint64_t erase_failures{0};
  std::uint64_t erased_bytes{0};

  std::uint64_t checkpoints{0};
  std::uint64_t checkpoint_failures{0};
  std::uint64_t checkpoint_ms{0};
};

// Bitcask-style store: values are appended to a single segment file, a key
// index maps keys to their location, and a separately persisted location set
// records which locations are live. Deleted ranges are scrubbed in the
// background.
class DB {
 public:
  DB(const DB&) = delete;
  DB& operator=(const DB&) = delete;

  // Recovers metadata and both indexes from options.data_dir and starts the
  // deletion and checkpoint workers.
  static Status Open(const Options& options, std::unique_ptr<DB>& db);
  ~DB();

  Status Put(const WriteOptions& options, std::string key, std::string value);
  // Deleting an absent key is OK.
  Status Delete(const WriteOptions& options, std::string key);
  // NotFound when the key is absent or its location is not corroborated.
  Status Get(const ReadOptions& options, std::string_view key, std::string& value);

  // Persists segment metadata, the location set and the key index.
  Status Checkpoint();
  // Blocks until every tombstone queued so far has been erased.
  void WaitForErasures();
  // Stops the background workers and runs the final checkpoint. No operation
  // may be issued afterwards.
  Status Close();

  Metrics GetMetrics() const;

 private:
  DB();

  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace bitkv

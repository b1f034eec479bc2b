#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace bitkv {

struct Options {
  // One directory per database: segment, metadata and both index files.
  std::filesystem::path data_dir{"bitkv-data"};
  bool create_if_missing{true};
  // Id of the single data segment; the file is named db-<id>.
  std::uint32_t segment_id{1};
  // Period of the background checkpoint worker (0 disables it; Close still checkpoints).
  std::size_t checkpoint_interval_ms{60 * 1000};
  // Bounded wait of the deletion worker on an empty tombstone queue.
  std::size_t tombstone_poll_interval_ms{1000};
  // Byte written over the range of an erased value.
  char erase_filler{' '};
  // fsync the segment and the index files when checkpointing.
  bool sync_on_checkpoint{false};
  // Cross-check Get against the location set before reading the segment.
  bool verify_locations{true};
};

struct WriteOptions {
  // fsync the segment after the append.
  bool sync{false};
};

struct ReadOptions {
  bool verify_location{true};
};

}  // namespace bitkv

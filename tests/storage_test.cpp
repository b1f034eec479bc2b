#include <cassert>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <thread>

#ifndef _WIN32
#include <sys/resource.h>
#endif

#include "append_log.h"
#include "key_index.h"
#include "location.h"
#include "location_set.h"
#include "segment_meta.h"
#include "tombstone_queue.h"
#include "util.h"

namespace {

std::filesystem::path TempDir(const std::string& name) {
  auto base = std::filesystem::temp_directory_path();
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::mt19937_64 rng(now);
  std::uniform_int_distribution<std::uint64_t> dist;
  auto path = base / (name + "-" + std::to_string(dist(rng)));
  std::filesystem::create_directories(path);
  return path;
}

bool ExpectOk(const bitkv::Status& s, const std::string& msg) {
  if (!s.ok()) {
    std::cerr << msg << ": " << s.ToString() << "\n";
    return false;
  }
  return true;
}

void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::string out;
  bitkv::ReadFileToString(path, out);
  return out;
}

bool TestLocationRecordText() {
  bitkv::LocationRecord rec{1, 4096, 17};
  assert(rec.ToString() == "1:4096:17");

  bitkv::LocationRecord parsed;
  if (!ExpectOk(bitkv::ParseLocation("1:4096:17", parsed), "parse")) return false;
  assert(parsed == rec);

  for (const char* bad : {"", "1", "1:2", "1:2:", ":2:3", "1:2:3:4", "a:2:3", "1:-2:3", "1: 2:3"}) {
    auto s = bitkv::ParseLocation(bad, parsed);
    if (!s.IsCorruption()) {
      std::cerr << "expected corruption for '" << bad << "'\n";
      return false;
    }
  }
  return true;
}

bool TestLegacyEqualityIgnoresOffset() {
  bitkv::LocationRecord a{1, 0, 5};
  bitkv::LocationRecord b{1, 100, 5};
  bitkv::LocationRecord c{1, 0, 6};
  bitkv::LocationRecord d{2, 0, 5};
  assert(bitkv::SameSegmentAndLength(a, b));
  assert(a != b);
  assert(!bitkv::SameSegmentAndLength(a, c));
  assert(!bitkv::SameSegmentAndLength(a, d));
  return true;
}

bool TestLocationSetInsertDelete() {
  bitkv::LocationSet set;
  bitkv::LocationRecord a{1, 0, 1};
  bitkv::LocationRecord b{1, 1, 1};
  bitkv::LocationRecord c{1, 10, 12};
  set.Insert(a);
  set.Insert(b);
  set.Insert(c);
  assert(set.Size() == 3);
  assert(set.Contains(b));

  assert(set.Delete(b));
  assert(!set.Contains(b));
  assert(!set.Delete(b));
  assert(set.Contains(a));
  assert(set.Contains(c));
  assert(set.Size() == 2);
  return true;
}

// Search matches the query at the tree root, so it corroborates any well
// formed record rather than performing an exact lookup.
bool TestSearchIsCoarseRootMatch() {
  bitkv::LocationSet set;
  bitkv::LocationRecord live{1, 0, 5};
  set.Insert(live);

  bitkv::LocationRecord found;
  if (!ExpectOk(set.Search(live, found), "search live")) return false;
  assert(found == live);

  bitkv::LocationRecord never_inserted{1, 64, 5};
  if (!ExpectOk(set.Search(never_inserted, found), "search coarse")) return false;
  assert(found == never_inserted);
  return true;
}

bool TestLocationSetPersistence() {
  auto dir = TempDir("bitkv-locset");
  auto path = dir / "locations.idx";

  bitkv::LocationSet set;
  for (std::uint64_t i = 0; i < 95; ++i) set.Insert(bitkv::LocationRecord{1, i * 10, 10});
  if (!ExpectOk(set.SaveToFile(path, /*sync=*/true), "save")) return false;

  const auto text = ReadFile(path);
  std::size_t commas = 0;
  std::size_t newlines = 0;
  for (char ch : text) {
    if (ch == ',') ++commas;
    if (ch == '\n') ++newlines;
  }
  assert(commas == 95);
  assert(newlines == 2);  // after the 40th and 80th record

  bitkv::LocationSet loaded;
  if (!ExpectOk(loaded.LoadFromFile(path), "load")) return false;
  assert(loaded.Size() == 95);
  for (std::uint64_t i = 0; i < 95; ++i) assert(loaded.Contains(bitkv::LocationRecord{1, i * 10, 10}));

  // Deleted records are not written back.
  assert(loaded.Delete(bitkv::LocationRecord{1, 0, 10}));
  if (!ExpectOk(loaded.SaveToFile(path, false), "save after delete")) return false;
  bitkv::LocationSet reloaded;
  if (!ExpectOk(reloaded.LoadFromFile(path), "reload")) return false;
  assert(reloaded.Size() == 94);
  assert(!reloaded.Contains(bitkv::LocationRecord{1, 0, 10}));

  std::filesystem::remove_all(dir);
  return true;
}

bool TestLocationSetLoadEdgeCases() {
  auto dir = TempDir("bitkv-locset-edge");
  bitkv::LocationSet set;
  if (!ExpectOk(set.LoadFromFile(dir / "missing.idx"), "load missing")) return false;
  assert(set.Size() == 0);

  WriteFile(dir / "empty.idx", "");
  if (!ExpectOk(set.LoadFromFile(dir / "empty.idx"), "load empty")) return false;
  assert(set.Size() == 0);

  WriteFile(dir / "sparse.idx", ",,1:0:3,\n\n1:3:4,,\r\n");
  if (!ExpectOk(set.LoadFromFile(dir / "sparse.idx"), "load sparse")) return false;
  assert(set.Size() == 2);
  assert(set.Contains(bitkv::LocationRecord{1, 3, 4}));

  WriteFile(dir / "bad.idx", "1:0:3,1:x:4,");
  auto s = set.LoadFromFile(dir / "bad.idx");
  assert(s.IsCorruption());

  std::filesystem::remove_all(dir);
  return true;
}

bool TestAppendLogReadEraseAndReopen() {
  auto dir = TempDir("bitkv-log");
  auto path = dir / "db-1";
  {
    bitkv::AppendLog log(path, 1);
    if (!ExpectOk(log.Open(), "open log")) return false;
    assert(log.Size() == 0);

    std::uint64_t off = 0;
    std::uint64_t len = 0;
    if (!ExpectOk(log.Append("hello", false, off, len), "append hello")) return false;
    assert(off == 0 && len == 5);
    if (!ExpectOk(log.Append("world!", true, off, len), "append world")) return false;
    assert(off == 5 && len == 6);
    assert(log.Size() == 11);

    std::string value;
    if (!ExpectOk(log.Read(5, 6, value), "read world")) return false;
    assert(value == "world!");

    if (!ExpectOk(log.Erase(0, 5, ' '), "erase hello")) return false;
    if (!ExpectOk(log.Read(0, 5, value), "read erased")) return false;
    assert(value == "     ");
    assert(*bitkv::FileSize(path) == 11);

    auto s = log.Read(8, 10, value);
    assert(s.code() == bitkv::Status::Code::kIOError);
    s = log.Erase(8, 10, ' ');
    assert(s.code() == bitkv::Status::Code::kIOError);
  }
  {
    bitkv::AppendLog log(path, 1);
    if (!ExpectOk(log.Open(), "reopen log")) return false;
    assert(log.Size() == 11);
    std::uint64_t off = 0;
    std::uint64_t len = 0;
    if (!ExpectOk(log.Append("!", false, off, len), "append after reopen")) return false;
    assert(off == 11 && len == 1);
  }
  {
    bitkv::AppendLog missing(dir / "nope" / "db-1", 1);
    std::string value;
    auto s = missing.Read(0, 1, value);
    assert(s.code() == bitkv::Status::Code::kIOError);
  }
  std::filesystem::remove_all(dir);
  return true;
}

#ifndef _WIN32
// A write cut short by the file size limit must not shift later appends.
bool TestAppendLogRecoversFromShortWrite() {
  auto dir = TempDir("bitkv-short-write");
  auto path = dir / "db-1";
  bitkv::AppendLog log(path, 1);
  if (!ExpectOk(log.Open(), "open log")) return false;

  std::uint64_t off = 0;
  std::uint64_t len = 0;
  if (!ExpectOk(log.Append("AAAAA", false, off, len), "append A")) return false;

  rlimit saved{};
  getrlimit(RLIMIT_FSIZE, &saved);
  auto old_handler = std::signal(SIGXFSZ, SIG_IGN);
  rlimit small = saved;
  small.rlim_cur = 8;
  setrlimit(RLIMIT_FSIZE, &small);
  auto s = log.Append("BBBBBBBBBB", false, off, len);
  setrlimit(RLIMIT_FSIZE, &saved);
  std::signal(SIGXFSZ, old_handler);

  assert(s.code() == bitkv::Status::Code::kIOError);
  assert(log.Size() == 5);
  assert(*bitkv::FileSize(path) == 5);

  if (!ExpectOk(log.Append("CCC", false, off, len), "append C")) return false;
  assert(off == 5 && len == 3);
  std::string value;
  if (!ExpectOk(log.Read(off, len, value), "read C")) return false;
  assert(value == "CCC");
  assert(*bitkv::FileSize(path) == 8);

  std::filesystem::remove_all(dir);
  return true;
}
#endif

bool TestKeyIndexPersistence() {
  auto dir = TempDir("bitkv-keys");
  auto path = dir / "keys.idx";

  bitkv::KeyIndex index;
  index.Put("a", bitkv::LocationRecord{1, 0, 1});
  index.Put("ab", bitkv::LocationRecord{1, 1, 1});
  index.Put(std::string("bin\0key", 7), bitkv::LocationRecord{1, 2, 300});
  index.Put("a", bitkv::LocationRecord{1, 5, 2});  // last put wins
  if (!ExpectOk(index.SaveToFile(path, true), "save keys")) return false;

  bitkv::KeyIndex loaded;
  if (!ExpectOk(loaded.LoadFromFile(path), "load keys")) return false;
  assert(loaded.Size() == 3);
  bitkv::LocationRecord rec;
  assert(loaded.Get("a", rec) && rec == (bitkv::LocationRecord{1, 5, 2}));
  assert(loaded.Get(std::string("bin\0key", 7), rec) && rec.length == 300);
  assert(loaded.Remove("ab", rec) && rec.offset == 1);
  assert(!loaded.Remove("ab", rec));

  bitkv::KeyIndex empty;
  if (!ExpectOk(empty.LoadFromFile(dir / "missing.idx"), "load missing keys")) return false;
  assert(empty.Size() == 0);

  // Flip one byte in the middle of the snapshot.
  auto blob = ReadFile(path);
  blob[blob.size() / 2] = static_cast<char>(blob[blob.size() / 2] ^ 0x5A);
  WriteFile(path, blob);
  auto s = loaded.LoadFromFile(path);
  assert(s.IsCorruption());

  WriteFile(path, "xyz");
  s = loaded.LoadFromFile(path);
  assert(s.IsCorruption());

  std::filesystem::remove_all(dir);
  return true;
}

bool TestSegmentMetaUnits() {
  auto dir = TempDir("bitkv-meta");
  auto path = dir / "db.meta";

  bitkv::SegmentMeta meta;
  if (!ExpectOk(meta.LoadFromFile(path), "load missing meta")) return false;
  assert(meta.file_size == 0 && meta.file_offset == 0);

  WriteFile(path, R"({"db_file_size": 3, "db_file_offset": 2500})");
  if (!ExpectOk(meta.LoadFromFile(path), "load meta")) return false;
  assert(meta.file_size == 3 * 1024);
  assert(meta.file_offset == 2500);

  meta.file_size = 5000;
  if (!ExpectOk(meta.SaveToFile(path, false), "save meta")) return false;
  bitkv::SegmentMeta again;
  if (!ExpectOk(again.LoadFromFile(path), "reload meta")) return false;
  assert(again.file_size == 4 * 1024);  // stored in whole KiB
  assert(again.file_offset == 2500);

  WriteFile(path, "{not json");
  assert(again.LoadFromFile(path).IsCorruption());
  WriteFile(path, R"({"db_file_offset": 1})");
  assert(again.LoadFromFile(path).IsCorruption());

  std::filesystem::remove_all(dir);
  return true;
}

bool TestTombstoneQueue() {
  bitkv::TombstoneQueue queue;
  bitkv::LocationRecord rec;
  assert(!queue.PopFor(std::chrono::milliseconds(10), rec));

  queue.Push(bitkv::LocationRecord{1, 0, 1});
  queue.Push(bitkv::LocationRecord{1, 1, 2});
  assert(queue.Pending() == 2);

  std::thread consumer([&queue] {
    bitkv::LocationRecord r;
    std::uint64_t expected_offset = 0;
    while (queue.PopFor(std::chrono::milliseconds(50), r)) {
      assert(r.offset == expected_offset);  // FIFO
      expected_offset += 1;
      queue.Done();
    }
  });
  queue.WaitIdle();
  assert(queue.Pending() == 0);
  queue.Stop();
  consumer.join();
  assert(queue.stopped());
  assert(!queue.PopFor(std::chrono::milliseconds(10), rec));
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestLocationRecordText();
  ok &= TestLegacyEqualityIgnoresOffset();
  ok &= TestLocationSetInsertDelete();
  ok &= TestSearchIsCoarseRootMatch();
  ok &= TestLocationSetPersistence();
  ok &= TestLocationSetLoadEdgeCases();
  ok &= TestAppendLogReadEraseAndReopen();
#ifndef _WIN32
  ok &= TestAppendLogRecoversFromShortWrite();
#endif
  ok &= TestKeyIndexPersistence();
  ok &= TestSegmentMetaUnits();
  ok &= TestTombstoneQueue();
  if (!ok) {
    std::cerr << "Tests failed\n";
    return 1;
  }
  std::cout << "All tests passed\n";
  return 0;
}

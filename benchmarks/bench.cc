#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "bitkv/db.h"

#ifndef BITKV_HAVE_SQLITE
#define BITKV_HAVE_SQLITE 0
#endif
#ifndef BITKV_HAVE_LEVELDB
#define BITKV_HAVE_LEVELDB 0
#endif

#if BITKV_HAVE_SQLITE
#include <sqlite3.h>
#endif

#if BITKV_HAVE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/options.h>
#endif

namespace {

struct CrudStats {
  double put_ms{0};
  double get_ms{0};
  double update_ms{0};
  double delete_ms{0};
};

enum class Mode { kSeq, kRand, kMt, kSyncSeq };

struct Args {
  std::size_t n{200'000};
  std::size_t threads{8};
  std::size_t ops_per_thread{50'000};
  std::size_t sync_n{1000};
  std::size_t value_len{100};
  std::uint64_t seed{12345};
  std::vector<std::string> dbs{"bitkv", "sqlite", "leveldb"};
  std::vector<Mode> modes{Mode::kSeq, Mode::kRand, Mode::kMt, Mode::kSyncSeq};
};

std::filesystem::path TempDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

void EnsureOk(const bitkv::Status& s, const std::string& msg) {
  if (!s.ok()) {
    std::cerr << msg << ": " << s.ToString() << "\n";
    std::exit(1);
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return static_cast<double>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

std::vector<std::size_t> MakeIds(const Args& args, Mode mode, const std::string& tag) {
  std::vector<std::size_t> ids(args.n);
  if (mode == Mode::kRand) {
    std::mt19937_64 rng(args.seed ^ static_cast<std::uint64_t>(std::hash<std::string>{}(tag)));
    std::uniform_int_distribution<std::size_t> dist(0, args.n - 1);
    for (auto& id : ids) id = dist(rng);
  } else {
    for (std::size_t i = 0; i < ids.size(); ++i) ids[i] = i;
  }
  return ids;
}

std::string KeyOf(std::size_t id) { return "key" + std::to_string(id); }

std::string ValueOf(char prefix, std::size_t id, std::size_t len) {
  auto v = std::string(1, prefix) + std::to_string(id);
  if (v.size() < len) v.append(len - v.size(), '.');
  return v;
}

// Runs put, get, overwrite and delete passes through the given callbacks.
template <typename PutFn, typename GetFn, typename DelFn>
CrudStats RunCrud(const Args& args, Mode mode, PutFn put, GetFn get, DelFn del) {
  CrudStats stats;
  auto ids = MakeIds(args, mode, "put");
  auto start = std::chrono::steady_clock::now();
  for (auto id : ids) put(KeyOf(id), ValueOf('v', id, args.value_len));
  stats.put_ms = ElapsedMs(start);

  ids = MakeIds(args, mode, "get");
  start = std::chrono::steady_clock::now();
  for (auto id : ids) get(KeyOf(id), mode == Mode::kRand);
  stats.get_ms = ElapsedMs(start);

  ids = MakeIds(args, mode, "update");
  start = std::chrono::steady_clock::now();
  for (auto id : ids) put(KeyOf(id), ValueOf('u', id, args.value_len));
  stats.update_ms = ElapsedMs(start);

  ids = MakeIds(args, mode, "delete");
  start = std::chrono::steady_clock::now();
  for (auto id : ids) del(KeyOf(id));
  stats.delete_ms = ElapsedMs(start);
  return stats;
}

CrudStats BenchBitkvSingle(const Args& args, Mode mode) {
  auto dir = TempDir("bitkv-suite");
  bitkv::Options opts;
  opts.data_dir = dir;
  opts.checkpoint_interval_ms = 0;
  std::unique_ptr<bitkv::DB> db;
  EnsureOk(bitkv::DB::Open(opts, db), "open bitkv");

  bitkv::WriteOptions wopts;
  wopts.sync = mode == Mode::kSyncSeq;
  bitkv::ReadOptions ropts;
  std::string value;

  auto stats = RunCrud(
      args, mode, [&](const std::string& k, const std::string& v) { EnsureOk(db->Put(wopts, k, v), "bitkv put"); },
      [&](const std::string& k, bool allow_miss) {
        auto s = db->Get(ropts, k, value);
        if (!s.ok() && !(allow_miss && s.IsNotFound())) EnsureOk(s, "bitkv get");
      },
      [&](const std::string& k) { EnsureOk(db->Delete(wopts, k), "bitkv delete"); });

  auto start = std::chrono::steady_clock::now();
  db->WaitForErasures();
  EnsureOk(db->Close(), "bitkv close");
  std::cout << "  (erasure drain + final checkpoint: " << ElapsedMs(start) << " ms)\n";

  db.reset();
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return stats;
}

CrudStats BenchBitkvMt(const Args& args) {
  CrudStats stats;
  auto dir = TempDir("bitkv-suite-mt");
  bitkv::Options opts;
  opts.data_dir = dir;
  opts.checkpoint_interval_ms = 0;
  std::unique_ptr<bitkv::DB> db;
  EnsureOk(bitkv::DB::Open(opts, db), "open bitkv mt");

  auto worker = [&](std::size_t tid, std::size_t count, double& put_ms, double& get_ms) {
    bitkv::WriteOptions wopts;
    bitkv::ReadOptions ropts;
    auto start_put = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < count; ++i) {
      auto key = "t" + std::to_string(tid) + "-k" + std::to_string(i);
      EnsureOk(db->Put(wopts, std::move(key), ValueOf('v', i, args.value_len)), "mt put");
    }
    put_ms = ElapsedMs(start_put);

    std::string value;
    auto start_get = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < count; ++i) {
      EnsureOk(db->Get(ropts, "t" + std::to_string(tid) + "-k" + std::to_string(i), value), "mt get");
    }
    get_ms = ElapsedMs(start_get);
  };

  std::vector<std::thread> threads;
  std::vector<double> put_times(args.threads, 0.0);
  std::vector<double> get_times(args.threads, 0.0);
  auto start_all = std::chrono::steady_clock::now();
  for (std::size_t t = 0; t < args.threads; ++t) {
    threads.emplace_back(worker, t, args.ops_per_thread, std::ref(put_times[t]), std::ref(get_times[t]));
  }
  for (auto& th : threads) th.join();
  stats.update_ms = ElapsedMs(start_all);
  stats.put_ms = *std::max_element(put_times.begin(), put_times.end());
  stats.get_ms = *std::max_element(get_times.begin(), get_times.end());

  db.reset();
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return stats;
}

#if BITKV_HAVE_LEVELDB
CrudStats BenchLevelDB(const Args& args, Mode mode) {
  auto dir = TempDir("leveldb-suite");
  leveldb::Options opts;
  opts.create_if_missing = true;
  opts.compression = leveldb::kNoCompression;
  std::unique_ptr<leveldb::DB> db;
  {
    leveldb::DB* raw = nullptr;
    auto s = leveldb::DB::Open(opts, dir.string(), &raw);
    if (!s.ok()) {
      std::cerr << "open leveldb: " << s.ToString() << "\n";
      std::exit(1);
    }
    db.reset(raw);
  }

  leveldb::WriteOptions lw;
  lw.sync = mode == Mode::kSyncSeq;
  std::string value;
  auto check = [](const leveldb::Status& s, const char* msg) {
    if (!s.ok()) {
      std::cerr << msg << ": " << s.ToString() << "\n";
      std::exit(1);
    }
  };

  auto stats = RunCrud(
      args, mode, [&](const std::string& k, const std::string& v) { check(db->Put(lw, k, v), "leveldb put"); },
      [&](const std::string& k, bool allow_miss) {
        auto s = db->Get(leveldb::ReadOptions(), k, &value);
        if (!s.ok() && !(allow_miss && s.IsNotFound())) check(s, "leveldb get");
      },
      [&](const std::string& k) { check(db->Delete(lw, k), "leveldb delete"); });

  db.reset();
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return stats;
}
#endif  // BITKV_HAVE_LEVELDB

#if BITKV_HAVE_SQLITE
void RequireSQLite(int rc, sqlite3* db, const char* msg) {
  if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
    std::cerr << msg << ": " << (db ? sqlite3_errmsg(db) : "unknown") << "\n";
    std::exit(1);
  }
}

CrudStats BenchSQLite(const Args& args, Mode mode) {
  auto dir = TempDir("sqlite-suite");
  auto db_path = dir / "kv.db";
  sqlite3* db = nullptr;
  RequireSQLite(sqlite3_open(db_path.string().c_str(), &db), db, "open sqlite");
  RequireSQLite(sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr), db, "pragma wal");
  RequireSQLite(sqlite3_exec(db, mode == Mode::kSyncSeq ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=OFF;",
                             nullptr, nullptr, nullptr),
                db, "pragma sync");
  RequireSQLite(sqlite3_exec(db, "CREATE TABLE IF NOT EXISTS kv (k TEXT PRIMARY KEY, v BLOB);", nullptr, nullptr,
                             nullptr),
                db, "create table");

  sqlite3_stmt* put_stmt = nullptr;
  sqlite3_stmt* get_stmt = nullptr;
  sqlite3_stmt* del_stmt = nullptr;
  RequireSQLite(sqlite3_prepare_v2(db, "REPLACE INTO kv(k,v) VALUES(?,?);", -1, &put_stmt, nullptr), db,
                "prepare put");
  RequireSQLite(sqlite3_prepare_v2(db, "SELECT v FROM kv WHERE k=?;", -1, &get_stmt, nullptr), db, "prepare get");
  RequireSQLite(sqlite3_prepare_v2(db, "DELETE FROM kv WHERE k=?;", -1, &del_stmt, nullptr), db, "prepare delete");

  auto step = [db](sqlite3_stmt* stmt, const char* msg) {
    RequireSQLite(sqlite3_step(stmt), db, msg);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  };

  auto stats = RunCrud(
      args, mode,
      [&](const std::string& k, const std::string& v) {
        sqlite3_bind_text(put_stmt, 1, k.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(put_stmt, 2, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        step(put_stmt, "sqlite put");
      },
      [&](const std::string& k, bool) {
        sqlite3_bind_text(get_stmt, 1, k.c_str(), -1, SQLITE_TRANSIENT);
        step(get_stmt, "sqlite get");
      },
      [&](const std::string& k) {
        sqlite3_bind_text(del_stmt, 1, k.c_str(), -1, SQLITE_TRANSIENT);
        step(del_stmt, "sqlite delete");
      });

  sqlite3_finalize(put_stmt);
  sqlite3_finalize(get_stmt);
  sqlite3_finalize(del_stmt);
  sqlite3_close(db);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return stats;
}
#endif  // BITKV_HAVE_SQLITE

double OpsPerSec(std::size_t count, double ms) {
  if (ms <= 0.0) return 0.0;
  return static_cast<double>(count) / (ms / 1000.0);
}

std::vector<std::string> Split(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    auto pos = arg.find('=');
    auto key = arg.substr(0, pos);
    auto val = (pos == std::string::npos) ? "" : arg.substr(pos + 1);
    if (key == "--n" && !val.empty()) {
      args.n = static_cast<std::size_t>(std::stoull(val));
    } else if (key == "--threads" && !val.empty()) {
      args.threads = static_cast<std::size_t>(std::stoull(val));
    } else if (key == "--ops-per-thread" && !val.empty()) {
      args.ops_per_thread = static_cast<std::size_t>(std::stoull(val));
    } else if (key == "--sync-n" && !val.empty()) {
      args.sync_n = static_cast<std::size_t>(std::stoull(val));
    } else if (key == "--value-len" && !val.empty()) {
      args.value_len = static_cast<std::size_t>(std::stoull(val));
    } else if (key == "--seed" && !val.empty()) {
      args.seed = static_cast<std::uint64_t>(std::stoull(val));
    } else if (key == "--dbs" && !val.empty()) {
      args.dbs = Split(val);
    } else if (key == "--modes" && !val.empty()) {
      args.modes.clear();
      for (const auto& m : Split(val)) {
        if (m == "seq") args.modes.push_back(Mode::kSeq);
        else if (m == "rand") args.modes.push_back(Mode::kRand);
        else if (m == "mt") args.modes.push_back(Mode::kMt);
        else if (m == "sync-seq") args.modes.push_back(Mode::kSyncSeq);
      }
    } else if (key == "--help") {
      std::cout << "Usage: ./bitkv_bench [--n=200000] [--threads=8] [--ops-per-thread=50000] "
                   "[--sync-n=1000] [--value-len=100] [--seed=12345] "
                   "[--dbs=bitkv,sqlite,leveldb] [--modes=seq,rand,mt,sync-seq]\n";
      return false;
    }
  }
  return true;
}

void PrintStats(const std::string& label, std::size_t n, const CrudStats& s) {
  std::cout << label << " put:    " << s.put_ms << " ms  (" << OpsPerSec(n, s.put_ms) << " ops/sec)\n";
  std::cout << label << " get:    " << s.get_ms << " ms  (" << OpsPerSec(n, s.get_ms) << " ops/sec)\n";
  std::cout << label << " update: " << s.update_ms << " ms  (" << OpsPerSec(n, s.update_ms) << " ops/sec)\n";
  std::cout << label << " delete: " << s.delete_ms << " ms  (" << OpsPerSec(n, s.delete_ms) << " ops/sec)\n";
}

std::string ModeName(Mode m) {
  switch (m) {
    case Mode::kSeq:
      return "seq";
    case Mode::kRand:
      return "rand";
    case Mode::kMt:
      return "mt";
    case Mode::kSyncSeq:
      return "sync-seq";
  }
  return "unknown";
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) return 0;

  std::cout << "bitkv benchmark suite\n";
  std::cout << "  n=" << args.n << ", threads=" << args.threads << ", ops_per_thread=" << args.ops_per_thread
            << ", sync_n=" << args.sync_n << ", value_len=" << args.value_len << ", seed=" << args.seed << "\n";

  auto ModeArgs = [&](Mode m) {
    Args out = args;
    if (m == Mode::kSyncSeq) out.n = std::min(args.n, args.sync_n);
    return out;
  };

  for (const auto& db_name : args.dbs) {
    for (auto mode : args.modes) {
      if (db_name == "bitkv") {
        if (mode == Mode::kMt) {
          auto s = BenchBitkvMt(args);
          std::cout << "\nbitkv (" << ModeName(mode) << ", " << args.threads << " threads, " << args.ops_per_thread
                    << " ops each)\n";
          std::cout << "  put (worst thread): " << s.put_ms << " ms  (" << OpsPerSec(args.ops_per_thread, s.put_ms)
                    << " ops/sec/thread)\n";
          std::cout << "  get (worst thread): " << s.get_ms << " ms  (" << OpsPerSec(args.ops_per_thread, s.get_ms)
                    << " ops/sec/thread)\n";
          std::cout << "  total wall time (put+get): " << s.update_ms << " ms\n";
        } else {
          auto a = ModeArgs(mode);
          std::cout << "\nbitkv (" << ModeName(mode) << ", n=" << a.n << ")\n";
          PrintStats("  ", a.n, BenchBitkvSingle(a, mode));
        }
      } else if (db_name == "sqlite") {
        if (mode == Mode::kMt) continue;
#if BITKV_HAVE_SQLITE
        auto a = ModeArgs(mode);
        std::cout << "\nSQLite (" << ModeName(mode) << ", n=" << a.n << ")\n";
        PrintStats("  ", a.n, BenchSQLite(a, mode));
#else
        std::cout << "\nSQLite requested but BITKV_HAVE_SQLITE=0; skipping.\n";
#endif
      } else if (db_name == "leveldb") {
        if (mode == Mode::kMt) continue;
#if BITKV_HAVE_LEVELDB
        auto a = ModeArgs(mode);
        std::cout << "\nLevelDB (" << ModeName(mode) << ", n=" << a.n << ")\n";
        PrintStats("  ", a.n, BenchLevelDB(a, mode));
#else
        std::cout << "\nLevelDB requested but BITKV_HAVE_LEVELDB=0; skipping.\n";
#endif
      }
    }
  }
  return 0;
}

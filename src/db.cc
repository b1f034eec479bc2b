#include "bitkv/db.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "append_log.h"
#include "key_index.h"
#include "location_set.h"
#include "segment_meta.h"
#include "tombstone_queue.h"

namespace bitkv {

class DB::Impl {
 public:
  explicit Impl(Options options)
      : options_(std::move(options)),
        data_dir_(options_.data_dir),
        meta_path_(data_dir_ / "db.meta"),
        locations_path_(data_dir_ / "locations.idx"),
        keys_path_(data_dir_ / "keys.idx"),
        log_(data_dir_ / ("db-" + std::to_string(options_.segment_id)), options_.segment_id) {}
  ~Impl();

  Status Init();

  Status Put(const WriteOptions& options, std::string key, std::string value);
  Status Delete(const WriteOptions& options, std::string key);
  Status Get(const ReadOptions& options, std::string_view key, std::string& value);
  Status Checkpoint();
  void WaitForErasures() { tombstones_.WaitIdle(); }
  Status Close();
  Metrics GetMetrics() const;

 private:
  Status Recover();
  void StartWorkers();
  void StopWorkers();
  void DeletionLoop();
  void CheckpointLoop();

  Options options_;
  std::filesystem::path data_dir_;
  std::filesystem::path meta_path_;
  std::filesystem::path locations_path_;
  std::filesystem::path keys_path_;

  // Put and Delete hold mu_ exclusively; Get and Checkpoint hold it shared.
  mutable std::shared_mutex mu_;
  AppendLog log_;
  LocationSet locations_;
  KeyIndex keys_;
  SegmentMeta meta_;

  TombstoneQueue tombstones_;
  std::thread deletion_thread_;

  std::thread checkpoint_thread_;
  std::condition_variable checkpoint_cv_;
  std::mutex checkpoint_mu_;
  bool stop_checkpoint_{false};
  // Serializes periodic, explicit and final checkpoints.
  std::mutex checkpoint_write_mu_;

  std::mutex close_mu_;
  // Stays set until Init succeeds, so a failed open never checkpoints.
  bool closed_{true};
  Status close_status_;

  struct MetricsCounters {
    std::atomic<std::uint64_t> puts{0};
    std::atomic<std::uint64_t> put_failures{0};
    std::atomic<std::uint64_t> deletes{0};
    std::atomic<std::uint64_t> gets{0};
    std::atomic<std::uint64_t> get_misses{0};
    std::atomic<std::uint64_t> bytes_appended{0};
    std::atomic<std::uint64_t> erasures{0};
    std::atomic<std::uint64_t> erase_failures{0};
    std::atomic<std::uint64_t> erased_bytes{0};
    std::atomic<std::uint64_t> checkpoints{0};
    std::atomic<std::uint64_t> checkpoint_failures{0};
    std::atomic<std::uint64_t> checkpoint_ms{0};
  } metrics_;
};

Status DB::Impl::Init() {
  std::error_code ec;
  if (!std::filesystem::exists(data_dir_, ec)) {
    if (!options_.create_if_missing) {
      return Status::InvalidArgument("data dir does not exist: " + data_dir_.string());
    }
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) return Status::IOError("create " + data_dir_.string() + " failed: " + ec.message());
  }

  Status s = Recover();
  if (!s.ok()) return s;
  StartWorkers();
  closed_ = false;
  return Status::OK();
}

Status DB::Impl::Recover() {
  Status s = meta_.LoadFromFile(meta_path_);
  if (!s.ok()) return s;
  s = locations_.LoadFromFile(locations_path_);
  if (!s.ok()) return s;
  s = keys_.LoadFromFile(keys_path_);
  if (!s.ok()) return s;

  // Records of another segment mean the directory was opened with the wrong
  // segment id; refuse before anything rewrites the index files.
  std::uint32_t foreign_segment = 0;
  std::size_t foreign = 0;
  keys_.ForEach([&](const std::string&, const LocationRecord& rec) {
    if (rec.segment_id != log_.segment_id()) {
      foreign_segment = rec.segment_id;
      ++foreign;
    }
  });
  if (foreign != 0) {
    return Status::InvalidArgument(keys_path_.string() + ": " + std::to_string(foreign) +
                                   " key(s) reference segment " + std::to_string(foreign_segment) +
                                   ", opened with segment " + std::to_string(log_.segment_id()));
  }

  s = log_.Open();
  if (!s.ok()) return s;

  const auto segment_size = log_.Size();
  if (meta_.file_offset != segment_size) {
    std::cerr << "bitkv: segment " << log_.path().string() << " is " << segment_size
              << " bytes, metadata recorded offset " << meta_.file_offset << "; using segment size\n";
    meta_.file_offset = segment_size;
  }
  meta_.file_size = segment_size;

  // Entries pointing past the end of the segment cannot be served.
  std::vector<std::string> dangling;
  keys_.ForEach([&](const std::string& key, const LocationRecord& rec) {
    if (rec.offset + rec.length > segment_size) dangling.push_back(key);
  });
  for (const auto& key : dangling) {
    LocationRecord rec;
    keys_.Remove(key, rec);
    locations_.Delete(rec);
  }
  if (!dangling.empty()) {
    std::cerr << "bitkv: dropped " << dangling.size() << " key(s) beyond the end of the segment\n";
  }
  return Status::OK();
}

void DB::Impl::StartWorkers() {
  deletion_thread_ = std::thread([this] { DeletionLoop(); });
  if (options_.checkpoint_interval_ms == 0) return;
  stop_checkpoint_ = false;
  checkpoint_thread_ = std::thread([this] { CheckpointLoop(); });
}

void DB::Impl::StopWorkers() {
  tombstones_.Stop();
  if (deletion_thread_.joinable()) deletion_thread_.join();
  {
    std::lock_guard lk(checkpoint_mu_);
    stop_checkpoint_ = true;
  }
  checkpoint_cv_.notify_all();
  if (checkpoint_thread_.joinable()) checkpoint_thread_.join();
}

void DB::Impl::DeletionLoop() {
  const auto poll = std::chrono::milliseconds(options_.tombstone_poll_interval_ms);
  while (!tombstones_.stopped()) {
    LocationRecord rec;
    if (!tombstones_.PopFor(poll, rec)) continue;
    Status s;
    if (rec.segment_id != log_.segment_id()) {
      s = Status::IOError("unknown segment " + std::to_string(rec.segment_id));
    } else {
      s = log_.Erase(rec.offset, rec.length, options_.erase_filler);
    }
    if (s.ok()) {
      metrics_.erasures.fetch_add(1, std::memory_order_relaxed);
      metrics_.erased_bytes.fetch_add(rec.length, std::memory_order_relaxed);
    } else {
      metrics_.erase_failures.fetch_add(1, std::memory_order_relaxed);
      std::cerr << "Erase " << rec.ToString() << " failed: " << s.ToString() << "\n";
    }
    tombstones_.Done();
  }
}

void DB::Impl::CheckpointLoop() {
  const auto interval = std::chrono::milliseconds(options_.checkpoint_interval_ms);
  std::unique_lock lk(checkpoint_mu_);
  while (!stop_checkpoint_) {
    if (checkpoint_cv_.wait_for(lk, interval, [this] { return stop_checkpoint_; })) break;
    lk.unlock();
    Status s = Checkpoint();
    if (!s.ok()) {
      std::cerr << "Checkpoint failed: " << s.ToString() << "\n";
    }
    lk.lock();
  }
}

Status DB::Impl::Put(const WriteOptions& options, std::string key, std::string value) {
  std::unique_lock lock(mu_);
  LocationRecord rec;
  rec.segment_id = log_.segment_id();
  Status s = log_.Append(value, options.sync, rec.offset, rec.length);
  if (!s.ok()) {
    metrics_.put_failures.fetch_add(1, std::memory_order_relaxed);
    return s;
  }
  metrics_.puts.fetch_add(1, std::memory_order_relaxed);
  metrics_.bytes_appended.fetch_add(rec.length, std::memory_order_relaxed);
  meta_.file_offset = rec.offset + rec.length;
  locations_.Insert(rec);
  // A superseded location stays in the segment and in the location set.
  keys_.Put(std::move(key), rec);
  return Status::OK();
}

Status DB::Impl::Delete(const WriteOptions& /*options*/, std::string key) {
  std::unique_lock lock(mu_);
  metrics_.deletes.fetch_add(1, std::memory_order_relaxed);
  LocationRecord rec;
  if (!keys_.Remove(key, rec)) return Status::OK();
  locations_.Delete(rec);
  tombstones_.Push(rec);
  return Status::OK();
}

Status DB::Impl::Get(const ReadOptions& options, std::string_view key, std::string& value) {
  std::shared_lock lock(mu_);
  metrics_.gets.fetch_add(1, std::memory_order_relaxed);
  LocationRecord rec;
  if (!keys_.Get(key, rec)) {
    metrics_.get_misses.fetch_add(1, std::memory_order_relaxed);
    return Status::NotFound("missing");
  }
  if (options_.verify_locations && options.verify_location) {
    LocationRecord live;
    Status s = locations_.Search(rec, live);
    if (s.IsNotFound()) {
      metrics_.get_misses.fetch_add(1, std::memory_order_relaxed);
      return Status::NotFound("location not live: " + rec.ToString());
    }
    if (!s.ok()) return s;
  }
  return log_.Read(rec.offset, rec.length, value);
}

Status DB::Impl::Checkpoint() {
  std::lock_guard writer(checkpoint_write_mu_);
  auto start = std::chrono::steady_clock::now();
  const bool sync = options_.sync_on_checkpoint;

  Status s;
  {
    // Shared: writers wait, readers continue.
    std::shared_lock lock(mu_);
    SegmentMeta meta = meta_;
    meta.file_size = log_.Size();
    if (sync) s = log_.Sync();
    if (s.ok()) s = meta.SaveToFile(meta_path_, sync);
    if (s.ok()) s = locations_.SaveToFile(locations_path_, sync);
    if (s.ok()) s = keys_.SaveToFile(keys_path_, sync);
  }

  if (!s.ok()) {
    metrics_.checkpoint_failures.fetch_add(1, std::memory_order_relaxed);
    return s;
  }
  auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  metrics_.checkpoints.fetch_add(1, std::memory_order_relaxed);
  metrics_.checkpoint_ms.fetch_add(static_cast<std::uint64_t>(elapsed), std::memory_order_relaxed);
  return Status::OK();
}

Status DB::Impl::Close() {
  std::lock_guard lk(close_mu_);
  if (closed_) return close_status_;
  StopWorkers();
  close_status_ = Checkpoint();
  closed_ = true;
  return close_status_;
}

Metrics DB::Impl::GetMetrics() const {
  Metrics m;
  m.puts = metrics_.puts.load(std::memory_order_relaxed);
  m.put_failures = metrics_.put_failures.load(std::memory_order_relaxed);
  m.deletes = metrics_.deletes.load(std::memory_order_relaxed);
  m.gets = metrics_.gets.load(std::memory_order_relaxed);
  m.get_misses = metrics_.get_misses.load(std::memory_order_relaxed);
  m.bytes_appended = metrics_.bytes_appended.load(std::memory_order_relaxed);
  m.erasures = metrics_.erasures.load(std::memory_order_relaxed);
  m.erase_failures = metrics_.erase_failures.load(std::memory_order_relaxed);
  m.erased_bytes = metrics_.erased_bytes.load(std::memory_order_relaxed);
  m.checkpoints = metrics_.checkpoints.load(std::memory_order_relaxed);
  m.checkpoint_failures = metrics_.checkpoint_failures.load(std::memory_order_relaxed);
  m.checkpoint_ms = metrics_.checkpoint_ms.load(std::memory_order_relaxed);
  return m;
}

DB::Impl::~Impl() {
  Status s = Close();
  if (!s.ok()) {
    std::cerr << "Final checkpoint failed: " << s.ToString() << "\n";
  }
}

DB::DB() = default;
DB::~DB() = default;

Status DB::Open(const Options& options, std::unique_ptr<DB>& db) {
  auto impl = std::make_unique<Impl>(options);
  Status s = impl->Init();
  if (!s.ok()) return s;
  db.reset(new DB());
  db->impl_ = std::move(impl);
  return Status::OK();
}

Status DB::Put(const WriteOptions& options, std::string key, std::string value) {
  return impl_->Put(options, std::move(key), std::move(value));
}

Status DB::Delete(const WriteOptions& options, std::string key) {
  return impl_->Delete(options, std::move(key));
}

Status DB::Get(const ReadOptions& options, std::string_view key, std::string& value) {
  return impl_->Get(options, key, value);
}

Status DB::Checkpoint() { return impl_->Checkpoint(); }

void DB::WaitForErasures() { impl_->WaitForErasures(); }

Status DB::Close() { return impl_->Close(); }

Metrics DB::GetMetrics() const { return impl_->GetMetrics(); }

}  // namespace bitkv

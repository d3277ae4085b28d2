#include "iris/image/image_cache.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>

#include "iris/core/atomic_file.hpp"
#include "iris/core/checksum.hpp"
#include "iris/core/log.hpp"

namespace iris::image {

namespace {

// Disk entry layout: "IRISIMG1\n" <key> "\n" <encoded bytes>. The key line guards
// against hash collisions between file names.
constexpr std::string_view kDiskMagic = "IRISIMG1\n";

auto file_time_to_system(std::filesystem::file_time_type ft) -> std::chrono::system_clock::time_point {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(ft));
}

} // namespace

ImageCache::ImageCache(CacheOptions options) : options_(std::move(options)) {
  if (!options_.disk_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(options_.disk_dir, ec);
    if (ec) {
      core::logger()->warn("[cache] cannot create {}: {}; disk tier disabled",
                           options_.disk_dir.string(), ec.message());
      options_.disk_dir.clear();
    }
  }
}

auto ImageCache::get(const std::string& key) -> std::optional<CacheEntry> {
  std::unique_lock lock(mutex_);

  auto it = index_.find(key);
  if (it == index_.end()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  auto list_it = it->second;
  if (is_expired(list_it->entry.fetched_at)) {
    evict(it);
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  // Move to front (most recently used)
  if (list_it != lru_list_.begin()) {
    lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
  }
  hits_.fetch_add(1, std::memory_order_relaxed);
  return list_it->entry;
}

auto ImageCache::put(const std::string& key, CacheEntry entry) -> void {
  const std::size_t size_bytes = entry.image ? entry.image->size_bytes() : 0;
  std::unique_lock lock(mutex_);

  auto it = index_.find(key);
  if (it != index_.end()) {
    auto list_it = it->second;
    bytes_used_ -= list_it->size_bytes;
    bytes_used_ += size_bytes;
    list_it->entry = std::move(entry);
    list_it->size_bytes = size_bytes;
    if (list_it != lru_list_.begin()) {
      lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
    }
    updates_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  make_space(size_bytes);
  lru_list_.emplace_front(Node{key, std::move(entry), size_bytes});
  index_[key] = lru_list_.begin();
  bytes_used_ += size_bytes;
  inserts_.fetch_add(1, std::memory_order_relaxed);
}

auto ImageCache::remove(const std::string& key) -> bool {
  std::unique_lock lock(mutex_);
  auto it = index_.find(key);
  if (it == index_.end()) return false;
  evict(it);
  return true;
}

auto ImageCache::clear() -> void {
  std::unique_lock lock(mutex_);
  lru_list_.clear();
  index_.clear();
  bytes_used_ = 0;
}

auto ImageCache::encoded_path(const std::string& key) const -> std::filesystem::path {
  return options_.disk_dir / (core::to_hex64(core::fnv1a64(key)) + ".img");
}

auto ImageCache::load_encoded(const std::string& key)
    -> std::optional<std::pair<std::vector<std::uint8_t>, std::chrono::system_clock::time_point>> {
  if (!has_disk_tier()) return std::nullopt;
  const auto p = encoded_path(key);

  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(p, ec);
  if (ec) return std::nullopt;
  const auto fetched_at = file_time_to_system(mtime);
  if (is_expired(fetched_at)) return std::nullopt;

  auto raw = core::read_file(p);
  if (!raw) return std::nullopt;

  const std::size_t header = kDiskMagic.size() + key.size() + 1;
  if (raw->size() <= header ||
      std::memcmp(raw->data(), kDiskMagic.data(), kDiskMagic.size()) != 0 ||
      std::memcmp(raw->data() + kDiskMagic.size(), key.data(), key.size()) != 0 ||
      (*raw)[header - 1] != '\n') {
    core::logger()->debug("[cache] ignoring foreign or damaged cache file {}", p.string());
    return std::nullopt;
  }
  disk_hits_.fetch_add(1, std::memory_order_relaxed);
  std::vector<std::uint8_t> bytes(raw->begin() + static_cast<std::ptrdiff_t>(header), raw->end());
  return std::make_pair(std::move(bytes), fetched_at);
}

auto ImageCache::store_encoded(const std::string& key, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
  if (!has_disk_tier()) return {};
  std::vector<std::uint8_t> out;
  out.reserve(kDiskMagic.size() + key.size() + 1 + bytes.size());
  out.insert(out.end(), kDiskMagic.begin(), kDiskMagic.end());
  out.insert(out.end(), key.begin(), key.end());
  out.push_back('\n');
  out.insert(out.end(), bytes.begin(), bytes.end());
  return core::write_file_atomic(encoded_path(key), out);
}

auto ImageCache::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return index_.size();
}

auto ImageCache::stats() const -> CacheStats {
  CacheStats s;
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  s.evictions = evictions_.load(std::memory_order_relaxed);
  s.inserts = inserts_.load(std::memory_order_relaxed);
  s.updates = updates_.load(std::memory_order_relaxed);
  s.disk_hits = disk_hits_.load(std::memory_order_relaxed);
  std::shared_lock lock(mutex_);
  s.entries = index_.size();
  s.bytes_used = bytes_used_;
  return s;
}

auto ImageCache::is_expired(std::chrono::system_clock::time_point fetched_at) const -> bool {
  if (!options_.ttl) return false;
  return (std::chrono::system_clock::now() - fetched_at) > *options_.ttl;
}

auto ImageCache::make_space(std::size_t required_bytes) -> void {
  if (options_.max_memory_bytes == 0) return;
  // Evict from back (least recently used). An entry larger than the whole
  // budget is still admitted once everything else is gone.
  while (bytes_used_ + required_bytes > options_.max_memory_bytes && !lru_list_.empty()) {
    auto it = index_.find(lru_list_.back().key);
    evict(it);
  }
}

auto ImageCache::evict(std::unordered_map<std::string, ListIterator>::iterator it) -> void {
  auto list_it = it->second;
  bytes_used_ -= list_it->size_bytes;
  lru_list_.erase(list_it);
  index_.erase(it);
  evictions_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace iris::image

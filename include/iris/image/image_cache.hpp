#pragma once

/** \file image_cache.hpp
 *  \brief Two-tier image cache keyed by canonical image reference.
 *
 * Memory tier: decoded images, least-recently-used order, optional byte budget
 * (0 = unbounded) and optional time-to-live measured from the fetch time.
 * Disk tier (remote sources only): the encoded bytes as downloaded, one file per
 * key under CacheOptions::disk_dir, written atomically. The file modification
 * time is the fetch timestamp, so the disk tier survives process restarts.
 *
 * Writes are idempotent and last-write-wins; concurrent fills of the same key
 * are safe. Callers only see get/put; the eviction policy is internal.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <list>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "iris/error.hpp"
#include "iris/image/decoded_image.hpp"

namespace iris::image {

struct CacheOptions {
  std::size_t max_memory_bytes{0};                 /**< 0 = unbounded */
  std::optional<std::chrono::seconds> ttl;         /**< nullopt = never refresh */
  std::filesystem::path disk_dir;                  /**< empty = no disk tier */
};

struct CacheEntry {
  DecodedImagePtr image;
  std::chrono::system_clock::time_point fetched_at{};
  /** Source freshness token; for local files "<mtime>:<size>", empty for remote. */
  std::string source_stamp;
};

/** \brief Point-in-time counters. */
struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t inserts{0};
  std::uint64_t updates{0};
  std::uint64_t disk_hits{0};
  std::size_t entries{0};
  std::size_t bytes_used{0};

  [[nodiscard]] auto hit_rate() const -> double {
    auto total = hits + misses;
    return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
  }
};

class ImageCache {
public:
  explicit ImageCache(CacheOptions options = {});

  ImageCache(const ImageCache&) = delete;
  ImageCache& operator=(const ImageCache&) = delete;

  /** \brief Memory-tier lookup; expired entries are dropped and reported as a miss. */
  [[nodiscard]] auto get(const std::string& key) -> std::optional<CacheEntry>;

  /** \brief Insert or replace a memory-tier entry. */
  auto put(const std::string& key, CacheEntry entry) -> void;

  auto remove(const std::string& key) -> bool;
  auto clear() -> void;

  /** \brief Disk-tier lookup of encoded bytes; nullopt when absent, expired or unreadable. */
  [[nodiscard]] auto load_encoded(const std::string& key)
      -> std::optional<std::pair<std::vector<std::uint8_t>, std::chrono::system_clock::time_point>>;

  /** \brief Persist encoded bytes for key (no-op without a disk tier). */
  auto store_encoded(const std::string& key, std::span<const std::uint8_t> bytes)
      -> std::expected<void, core::error>;

  /** \brief Disk-tier file backing key. */
  [[nodiscard]] auto encoded_path(const std::string& key) const -> std::filesystem::path;

  [[nodiscard]] auto has_disk_tier() const noexcept -> bool { return !options_.disk_dir.empty(); }
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto stats() const -> CacheStats;

private:
  struct Node {
    std::string key;
    CacheEntry entry;
    std::size_t size_bytes;
  };
  using ListIterator = std::list<Node>::iterator;

  [[nodiscard]] auto is_expired(std::chrono::system_clock::time_point fetched_at) const -> bool;
  auto make_space(std::size_t required_bytes) -> void;
  auto evict(std::unordered_map<std::string, ListIterator>::iterator it) -> void;

  CacheOptions options_;
  mutable std::shared_mutex mutex_;
  std::list<Node> lru_list_;
  std::unordered_map<std::string, ListIterator> index_;
  std::size_t bytes_used_{0};

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> inserts_{0};
  std::atomic<std::uint64_t> updates_{0};
  std::atomic<std::uint64_t> disk_hits_{0};
};

} // namespace iris::image

#pragma once

/** \file index_store.hpp
 *  \brief Vector Index Store: the published index, its file, and atomic replacement.
 *
 * Readers call snapshot() and keep the returned pointer for as long as they
 * need; a later publish() never invalidates it. publish() first replaces the
 * index file (temp + fsync + rename), then swaps the in-memory pointer, so the
 * file and memory never disagree about which version is authoritative and a
 * failed write leaves both on the prior version.
 *
 * Thread-safety: snapshot() is wait-free with respect to rebuild work; it only
 * contends with the pointer swap itself. publish() calls are serialized.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>

#include "iris/error.hpp"
#include "iris/index/index.hpp"
#include "iris/index/index_file.hpp"

namespace iris::index {

class IndexStore {
public:
  IndexStore(std::filesystem::path file, IndexFileOptions file_options = {});

  IndexStore(const IndexStore&) = delete;
  IndexStore& operator=(const IndexStore&) = delete;

  /** \brief Read the index file and make it the published snapshot.
   *
   * Errors: not_found (no file; the empty snapshot stays published),
   * corrupt_index (reported on the alert channel). When the damaged file
   * still has an intact header naming a version above the published one, an
   * empty index at that version becomes the snapshot so the next publish
   * does not reuse a version number; otherwise the snapshot is unchanged.
   */
  auto load() -> std::expected<IndexPtr, core::error>;

  /** \brief Persist and atomically publish a new index.
   *
   * Errors: invalid_parameter when next->version() is not greater than the
   * published version; io_failed when the file could not be replaced. On
   * error the published snapshot is unchanged.
   */
  auto publish(IndexPtr next) -> std::expected<void, core::error>;

  /** \brief Current published index; never null (an empty version-0 index before any load/publish). */
  [[nodiscard]] auto snapshot() const -> IndexPtr;

  [[nodiscard]] auto version() const -> std::uint64_t { return snapshot()->version(); }
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return file_; }

private:
  std::filesystem::path file_;
  IndexFileOptions file_options_;
  std::mutex publish_mu_;              /**< serializes file replace + swap */
  mutable std::mutex snapshot_mu_;     /**< guards current_ */
  IndexPtr current_;
};

} // namespace iris::index

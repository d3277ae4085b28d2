#pragma once

/** \file rebuild_coordinator.hpp
 *  \brief Serialized index rebuilds: catalog -> acquire + encode -> publish.
 *
 * One dedicated worker thread executes rebuilds strictly one at a time.
 * Requests that arrive while a rebuild is running are queued; all requests
 * waiting at the moment the worker becomes free are served by a single rebuild
 * that reads the catalog after every one of them was made, and every waiter
 * receives that rebuild's outcome. A request is never dropped.
 *
 * Per rebuild:
 *   1. take a catalog snapshot and the published index
 *   2. incremental: reuse vectors of products already in the published index
 *      (same model and dimension), encode the rest; full: encode everything
 *   3. encode on a WorkerPool; a product whose image cannot be acquired or
 *      encoded is excluded and recorded
 *   4. failure check: nothing included from a non-empty catalog, or
 *      excluded / catalog_size > max_failure_ratio -> failed, prior index kept
 *   5. publish version + 1 through IndexStore
 *
 * Cancellation is cooperative: the stop flag is checked between products and
 * immediately before publish. A cancelled rebuild never publishes.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "iris/catalog/catalog_store.hpp"
#include "iris/core/worker_pool.hpp"
#include "iris/embed/image_encoder.hpp"
#include "iris/error.hpp"
#include "iris/image/image_acquirer.hpp"
#include "iris/index/index_store.hpp"

namespace iris::rebuild {

enum class RebuildKind : std::uint8_t { incremental, full };

enum class RebuildStatus : std::uint8_t {
  published,   /**< every catalog product is in the new index */
  partial,     /**< published with exclusions */
  failed,      /**< prior index retained */
  cancelled    /**< stopped before publish; prior index retained */
};

/** \brief Stable lowercase name ("published", "partial", "failed", "cancelled"). */
constexpr auto status_name(RebuildStatus s) noexcept -> std::string_view {
  switch (s) {
    case RebuildStatus::published: return "published";
    case RebuildStatus::partial:   return "partial";
    case RebuildStatus::failed:    return "failed";
    case RebuildStatus::cancelled: return "cancelled";
  }
  return "unknown";
}

struct ExcludedProduct {
  std::string product_id;
  core::error error;
};

struct RebuildOutcome {
  RebuildStatus status{RebuildStatus::failed};
  RebuildKind kind{RebuildKind::incremental};
  std::uint64_t index_version{0};          /**< version published after this rebuild */
  std::size_t included{0};                 /**< records in the resulting index */
  std::size_t encoded{0};                  /**< records produced by this run (not carried over) */
  std::vector<ExcludedProduct> excluded;
  std::optional<core::error> error;        /**< set for failed and cancelled */
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] auto ok() const noexcept -> bool {
    return status == RebuildStatus::published || status == RebuildStatus::partial;
  }
};

struct RebuildOptions {
  double max_failure_ratio{0.5};                     /**< in [0, 1] */
  std::size_t workers{4};                            /**< encode parallelism */
  std::chrono::milliseconds fetch_timeout{15000};    /**< per product image */
};

struct RebuildStats {
  std::uint64_t requests{0};
  std::uint64_t completed{0};     /**< published or partial */
  std::uint64_t failed{0};
  std::uint64_t cancelled{0};
  std::size_t pending{0};         /**< waiters not yet picked up by the worker */
  bool running{false};
  std::optional<RebuildStatus> last_status;
};

/** \brief Returns the catalog in insertion order. Must be thread-safe. */
using CatalogSource = std::function<std::vector<catalog::Product>()>;

class RebuildCoordinator {
public:
  RebuildCoordinator(index::IndexStore& store, image::ImageAcquirer& acquirer,
                     const embed::EmbeddingEncoder& encoder, CatalogSource catalog,
                     RebuildOptions options = {});

  /** \brief Cancels pending and running work, then joins the worker. */
  ~RebuildCoordinator();

  RebuildCoordinator(const RebuildCoordinator&) = delete;
  RebuildCoordinator& operator=(const RebuildCoordinator&) = delete;

  /** \brief Queue a rebuild. The future resolves when a rebuild covering this request finishes. */
  auto request(RebuildKind kind) -> std::shared_future<RebuildOutcome>;

  /** \brief Queue only when idle.
   *
   * Errors: rebuild_in_progress when a rebuild is running or queued.
   */
  auto request_if_idle(RebuildKind kind) -> std::expected<std::shared_future<RebuildOutcome>, core::error>;

  /** \brief Stop the running rebuild before it publishes. Queued requests still run. */
  auto cancel_current() -> void;

  /** \brief Stop the running rebuild and resolve every queued request as cancelled. */
  auto cancel_pending() -> void;

  [[nodiscard]] auto stats() const -> RebuildStats;

private:
  struct Batch {
    RebuildKind kind{RebuildKind::incremental};
    std::size_t waiters{0};
    std::promise<RebuildOutcome> promise;
    std::shared_future<RebuildOutcome> future;
    std::shared_ptr<std::atomic<bool>> cancel = std::make_shared<std::atomic<bool>>(false);
  };

  auto enqueue_locked(RebuildKind kind) -> std::shared_future<RebuildOutcome>;
  auto worker_loop() -> void;
  auto run(RebuildKind kind, const std::atomic<bool>& cancel) -> RebuildOutcome;
  auto record_locked(const RebuildOutcome& outcome) -> void;

  index::IndexStore& store_;
  image::ImageAcquirer& acquirer_;
  const embed::EmbeddingEncoder& encoder_;
  CatalogSource catalog_;
  RebuildOptions opts_;
  core::WorkerPool pool_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::unique_ptr<Batch> pending_;
  std::shared_ptr<std::atomic<bool>> running_cancel_;
  bool stop_{false};
  RebuildStats stats_;

  std::thread worker_;   /**< last member: started after everything above is initialized */
};

} // namespace iris::rebuild

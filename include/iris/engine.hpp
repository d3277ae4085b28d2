#pragma once

/** \file engine.hpp
 *  \brief Public facade: catalog, search, classification and rebuild control.
 *
 * Engine owns every component and wires them together:
 *
 *   search:      ImageAcquirer -> EmbeddingEncoder -> rank(snapshot)
 *   add_product: CatalogStore::append -> RebuildCoordinator -> IndexStore::publish
 *
 * search() and classify() never block on a rebuild; they rank against the
 * snapshot that was published when they started. add_product() appends and
 * queues the rebuild under one mutex, so catalog order and rebuild order agree.
 *
 * Every operation returns std::expected with an iris::core::error; a failed
 * rebuild is reported through RebuildOutcome, not as an error, because the
 * catalog mutation itself succeeded.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "iris/catalog/catalog_store.hpp"
#include "iris/config.hpp"
#include "iris/embed/image_encoder.hpp"
#include "iris/error.hpp"
#include "iris/image/http_fetcher.hpp"
#include "iris/image/image_acquirer.hpp"
#include "iris/index/index_store.hpp"
#include "iris/rebuild/rebuild_coordinator.hpp"
#include "iris/search/classifier.hpp"
#include "iris/search/ranker.hpp"

namespace iris {

/** \brief Replaceable collaborators; null members get the configured defaults. */
struct EngineDeps {
  std::shared_ptr<embed::ImageEncoder> encoder;   /**< default: ColorHistogramEncoder */
  std::shared_ptr<image::HttpFetcher> fetcher;    /**< default: CurlFetcher (unless remote is disabled) */
};

struct AddProductResult {
  catalog::Product product;
  rebuild::RebuildOutcome rebuild;
};

struct EngineStats {
  std::uint64_t index_version{0};
  std::size_t index_records{0};
  std::uint32_t dimension{0};
  std::string model_name;
  std::size_t catalog_size{0};
  image::CacheStats cache;
  rebuild::RebuildStats rebuild;
};

class Engine {
public:
  /** \brief Create the data directory, load catalog and index, run ensure_index.
   *
   * Errors: config_invalid, io_failed (data dir or catalog unreadable),
   * unsupported (encoder kind not available in this build), and encoder
   * construction errors.
   */
  static auto open(EngineConfig config, EngineDeps deps = {})
      -> std::expected<std::unique_ptr<Engine>, core::error>;

  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /** \brief Find products visually similar to an image.
   *
   * \param top_k     result limit; default from SearchOptions
   * \param min_score score floor; default from SearchOptions
   * An empty result means nothing cleared min_score. When the published
   * index has no records while the catalog is non-empty the call fails with
   * not_found instead; an empty catalog gives an empty result.
   * Errors: invalid_parameter (top_k <= 0, non-finite min_score), not_found,
   * network_error, invalid_image, encoding_failure, timeout (overall
   * deadline exceeded, including a model call still running).
   */
  auto search(std::string_view image_ref, std::optional<int> top_k = std::nullopt,
              std::optional<float> min_score = std::nullopt)
      -> std::expected<std::vector<search::QueryResult>, core::error>;

  /** \brief Append a product and wait for the rebuild that covers it.
   *
   * Errors: invalid_parameter, io_failed. Rebuild problems are in the result.
   */
  auto add_product(catalog::NewProduct entry) -> std::expected<AddProductResult, core::error>;

  /** \brief Queue a full re-encode of the catalog and wait for it. */
  auto full_rebuild() -> rebuild::RebuildOutcome;

  /** \brief Full rebuild only when nothing is running or queued (rebuild_in_progress otherwise). */
  auto try_full_rebuild() -> std::expected<rebuild::RebuildOutcome, core::error>;

  /** \brief Cooperatively stop the running rebuild and cancel queued ones. */
  auto cancel_rebuilds() -> void;

  /** \brief Bring the index in line with the catalog and the configured encoder.
   *
   * Full rebuild when the index file is missing or corrupt or was built by a
   * different model or dimension; incremental when catalog products lack
   * records; nothing otherwise (returns nullopt).
   */
  auto ensure_index() -> std::optional<rebuild::RebuildOutcome>;

  /** \brief Predict a category for an image from per-category centroids. */
  auto classify(std::string_view image_ref) -> std::expected<search::Classification, core::error>;

  [[nodiscard]] auto list_products() const -> std::vector<catalog::Product>;
  [[nodiscard]] auto find_product(std::string_view id) const -> std::expected<catalog::Product, core::error>;
  [[nodiscard]] auto snapshot() const -> index::IndexPtr;
  [[nodiscard]] auto stats() const -> EngineStats;
  [[nodiscard]] auto config() const noexcept -> const EngineConfig& { return config_; }

private:
  explicit Engine(EngineConfig config);

  auto encode_query(std::string_view image_ref, std::chrono::steady_clock::time_point deadline)
      -> std::expected<embed::Embedding, core::error>;

  EngineConfig config_;
  std::unique_ptr<catalog::CatalogStore> catalog_;
  std::unique_ptr<image::ImageAcquirer> acquirer_;
  std::shared_ptr<embed::EmbeddingEncoder> encoder_;        /**< shared with in-flight query encodes */
  std::unique_ptr<index::IndexStore> store_;
  std::mutex mutation_mu_;                                   /**< catalog append + rebuild enqueue */
  std::unique_ptr<rebuild::RebuildCoordinator> coordinator_; /**< destroyed first */
};

} // namespace iris

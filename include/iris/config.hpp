#pragma once

/** \file config.hpp
 *  \brief Engine configuration: defaults, IRIS_* environment overlay, validation.
 *
 * Environment variables (all optional; malformed values are config_invalid):
 *   IRIS_DATA_DIR                   directory holding products.json, embeddings.idx, images_cache/
 *   IRIS_FETCH_TIMEOUT_MS           per-download bound
 *   IRIS_MAX_IMAGE_BYTES            largest accepted download
 *   IRIS_CACHE_MAX_BYTES            memory-tier budget, 0 = unbounded
 *   IRIS_SEARCH_DEADLINE_MS         overall bound for one search
 *   IRIS_DEFAULT_TOP_K              used when the caller passes no top_k
 *   IRIS_DEFAULT_MIN_SCORE          used when the caller passes no min_score
 *   IRIS_REBUILD_MAX_FAILURE_RATIO  [0, 1]
 *   IRIS_REBUILD_WORKERS            encode threads during rebuilds
 *   IRIS_INDEX_ZSTD_LEVEL           0 (off) .. 19
 *   IRIS_LOG_LEVEL                  trace|debug|info|warn|error|off
 *   IRIS_ENCODER                    color-histogram | onnx-clip
 *   IRIS_ONNX_MODEL                 model path for onnx-clip
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

#include "iris/error.hpp"
#include "iris/image/http_fetcher.hpp"
#include "iris/image/image_cache.hpp"
#include "iris/rebuild/rebuild_coordinator.hpp"

namespace iris {

struct AcquirerOptions {
  image::FetchOptions fetch;
  bool allow_remote{true};   /**< false: URL references fail with unsupported */
};

struct SearchOptions {
  int default_top_k{12};
  float default_min_score{0.0f};
  std::chrono::milliseconds deadline{30000};   /**< acquire + encode + rank */
};

struct EncoderOptions {
  std::string kind{"color-histogram"};         /**< or "onnx-clip" */
  std::filesystem::path onnx_model;
};

struct EngineConfig {
  std::filesystem::path data_dir{"data"};
  AcquirerOptions acquirer;
  image::CacheOptions cache;                   /**< disk_dir defaults to data_dir/images_cache */
  rebuild::RebuildOptions rebuild;
  SearchOptions search;
  EncoderOptions encoder;
  int index_zstd_level{0};
  std::string log_level{"info"};
  bool rebuild_on_open{true};                  /**< run ensure_index when the engine opens */

  [[nodiscard]] auto catalog_path() const -> std::filesystem::path { return data_dir / "products.json"; }
  [[nodiscard]] auto index_path() const -> std::filesystem::path { return data_dir / "embeddings.idx"; }
  [[nodiscard]] auto image_cache_dir() const -> std::filesystem::path { return data_dir / "images_cache"; }
};

/** \brief Overlay IRIS_* environment variables onto \p base, then validate. */
auto load_config_from_env(EngineConfig base = {}) -> std::expected<EngineConfig, core::error>;

/** \brief Range checks. Errors: config_invalid naming the offending field. */
auto validate(const EngineConfig& config) -> std::expected<void, core::error>;

} // namespace iris

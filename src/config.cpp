#include "iris/config.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include "iris/core/platform_utils.hpp"

namespace iris {

namespace {

constexpr const char* kComponent = "config";

auto invalid(std::string message) -> std::unexpected<core::error> {
  return core::make_unexpected(core::error_code::config_invalid, std::move(message), kComponent);
}

template <typename T>
auto env_number(const char* name, T& out) -> std::expected<void, core::error> {
  auto raw = core::getenv_nonempty(name);
  if (!raw) return {};
  auto v = core::parse_number<T>(*raw);
  if (!v) return invalid(std::string(name) + "='" + *raw + "' is not a valid number");
  out = *v;
  return {};
}

auto env_millis(const char* name, std::chrono::milliseconds& out) -> std::expected<void, core::error> {
  std::int64_t ms = out.count();
  if (auto r = env_number(name, ms); !r) return r;
  out = std::chrono::milliseconds(ms);
  return {};
}

} // namespace

auto load_config_from_env(EngineConfig cfg) -> std::expected<EngineConfig, core::error> {
  if (auto dir = core::getenv_nonempty("IRIS_DATA_DIR")) cfg.data_dir = *dir;

  std::expected<void, core::error> r;
  if (r = env_millis("IRIS_FETCH_TIMEOUT_MS", cfg.acquirer.fetch.timeout); !r) return std::unexpected(r.error());
  if (r = env_number("IRIS_MAX_IMAGE_BYTES", cfg.acquirer.fetch.max_bytes); !r) return std::unexpected(r.error());
  if (r = env_number("IRIS_CACHE_MAX_BYTES", cfg.cache.max_memory_bytes); !r) return std::unexpected(r.error());
  if (r = env_millis("IRIS_SEARCH_DEADLINE_MS", cfg.search.deadline); !r) return std::unexpected(r.error());
  if (r = env_number("IRIS_DEFAULT_TOP_K", cfg.search.default_top_k); !r) return std::unexpected(r.error());
  if (r = env_number("IRIS_DEFAULT_MIN_SCORE", cfg.search.default_min_score); !r) return std::unexpected(r.error());
  if (r = env_number("IRIS_REBUILD_MAX_FAILURE_RATIO", cfg.rebuild.max_failure_ratio); !r) return std::unexpected(r.error());
  if (r = env_number("IRIS_REBUILD_WORKERS", cfg.rebuild.workers); !r) return std::unexpected(r.error());
  if (r = env_number("IRIS_INDEX_ZSTD_LEVEL", cfg.index_zstd_level); !r) return std::unexpected(r.error());

  if (auto lvl = core::getenv_nonempty("IRIS_LOG_LEVEL")) cfg.log_level = *lvl;
  if (auto enc = core::getenv_nonempty("IRIS_ENCODER")) cfg.encoder.kind = *enc;
  if (auto model = core::getenv_nonempty("IRIS_ONNX_MODEL")) cfg.encoder.onnx_model = *model;

  if (auto v = validate(cfg); !v) return std::unexpected(v.error());
  return cfg;
}

auto validate(const EngineConfig& c) -> std::expected<void, core::error> {
  using namespace std::chrono_literals;
  if (c.data_dir.empty()) return invalid("data_dir must not be empty");
  if (c.acquirer.fetch.timeout <= 0ms) return invalid("fetch timeout must be positive");
  if (c.acquirer.fetch.connect_timeout <= 0ms) return invalid("connect timeout must be positive");
  if (c.acquirer.fetch.max_bytes == 0) return invalid("max image bytes must be positive");
  if (c.search.deadline <= 0ms) return invalid("search deadline must be positive");
  if (c.search.default_top_k <= 0) return invalid("default top_k must be positive");
  if (!std::isfinite(c.search.default_min_score) || c.search.default_min_score < -1.0f ||
      c.search.default_min_score > 1.0f) {
    return invalid("default min_score must lie in [-1, 1]");
  }
  if (!(c.rebuild.max_failure_ratio >= 0.0 && c.rebuild.max_failure_ratio <= 1.0)) {
    return invalid("rebuild max_failure_ratio must lie in [0, 1]");
  }
  if (c.rebuild.workers == 0) return invalid("rebuild workers must be at least 1");
  if (c.rebuild.fetch_timeout <= 0ms) return invalid("rebuild fetch timeout must be positive");
  if (c.index_zstd_level < 0 || c.index_zstd_level > 19) return invalid("index zstd level must lie in [0, 19]");
  if (c.encoder.kind != "color-histogram" && c.encoder.kind != "onnx-clip") {
    return invalid("unknown encoder '" + c.encoder.kind + "' (color-histogram|onnx-clip)");
  }
  if (c.encoder.kind == "onnx-clip" && c.encoder.onnx_model.empty()) {
    return invalid("encoder onnx-clip requires IRIS_ONNX_MODEL");
  }
  static constexpr const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "off"};
  bool level_ok = false;
  for (const char* l : kLevels) level_ok = level_ok || c.log_level == l;
  if (!level_ok) return invalid("unknown log level '" + c.log_level + "'");
  return {};
}

} // namespace iris

#include "iris/engine.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <future>
#include <string>
#include <system_error>
#include <thread>

#include "iris/core/log.hpp"
#include "iris/embed/color_histogram_encoder.hpp"

namespace iris {

namespace {

constexpr const char* kComponent = "engine";

using Clock = std::chrono::steady_clock;

auto timed_out(std::string_view stage, std::chrono::milliseconds deadline) -> std::unexpected<core::error> {
  return core::make_unexpected(core::error_code::timeout,
                               "search exceeded its " + std::to_string(deadline.count()) +
                                   " ms deadline during " + std::string(stage),
                               kComponent);
}

} // namespace

Engine::Engine(EngineConfig config) : config_(std::move(config)) {}

Engine::~Engine() = default;

auto Engine::open(EngineConfig config, EngineDeps deps) -> std::expected<std::unique_ptr<Engine>, core::error> {
  if (auto v = validate(config); !v) return std::unexpected(v.error());
  if (auto lvl = core::set_log_level(config.log_level); !lvl) return std::unexpected(lvl.error());

  std::error_code ec;
  std::filesystem::create_directories(config.data_dir, ec);
  if (ec) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "cannot create data dir " + config.data_dir.string() + ": " + ec.message(),
                                 kComponent);
  }
  if (config.cache.disk_dir.empty()) config.cache.disk_dir = config.image_cache_dir();

  if (!deps.encoder) {
    if (config.encoder.kind != "color-histogram") {
      return core::make_unexpected(core::error_code::unsupported,
                                   "encoder '" + config.encoder.kind +
                                       "' must be supplied by the caller in this build",
                                   kComponent);
    }
    deps.encoder = std::make_shared<embed::ColorHistogramEncoder>();
  }
  if (!deps.fetcher && config.acquirer.allow_remote) {
    deps.fetcher = std::make_shared<image::CurlFetcher>(config.acquirer.fetch);
  }

  std::unique_ptr<Engine> engine(new Engine(std::move(config)));
  const auto& cfg = engine->config_;

  auto catalog = catalog::CatalogStore::open(cfg.catalog_path());
  if (!catalog) return std::unexpected(catalog.error());
  engine->catalog_ = std::move(*catalog);

  engine->acquirer_ = std::make_unique<image::ImageAcquirer>(
      cfg.acquirer.allow_remote ? deps.fetcher : nullptr, cfg.cache, cfg.acquirer.fetch.max_bytes);
  engine->encoder_ = std::make_shared<embed::EmbeddingEncoder>(deps.encoder);
  if (engine->encoder_->dimension() == 0) {
    return core::make_unexpected(core::error_code::config_invalid,
                                 "encoder " + engine->encoder_->model_name() + " reports dimension 0",
                                 kComponent);
  }
  engine->store_ = std::make_unique<index::IndexStore>(
      cfg.index_path(), index::IndexFileOptions{cfg.index_zstd_level});

  auto* catalog_ptr = engine->catalog_.get();
  engine->coordinator_ = std::make_unique<rebuild::RebuildCoordinator>(
      *engine->store_, *engine->acquirer_, *engine->encoder_,
      [catalog_ptr] { return catalog_ptr->list(); }, cfg.rebuild);

  core::logger()->info("[engine] opened {} (encoder {}, dim {}, {} products)", cfg.data_dir.string(),
                       engine->encoder_->model_name(), engine->encoder_->dimension(),
                       engine->catalog_->size());

  if (cfg.rebuild_on_open) {
    engine->ensure_index();
  } else if (auto loaded = engine->store_->load(); !loaded && loaded.error().code != core::error_code::not_found) {
    core::logger()->warn("[engine] index not loaded: {}", loaded.error().message);
  }
  return engine;
}

auto Engine::ensure_index() -> std::optional<rebuild::RebuildOutcome> {
  auto loaded = store_->load();
  std::optional<rebuild::RebuildKind> needed;
  if (!loaded) {
    needed = rebuild::RebuildKind::full;
    core::logger()->info("[engine] index unavailable ({}); full rebuild", core::to_string(loaded.error().code));
  } else {
    const auto& idx = **loaded;
    if (idx.model_name() != encoder_->model_name() || idx.dimension() != encoder_->dimension()) {
      needed = rebuild::RebuildKind::full;
      core::logger()->info("[engine] index v{} built by {} (dim {}), encoder is {} (dim {}); full rebuild",
                           idx.version(), idx.model_name(), idx.dimension(), encoder_->model_name(),
                           encoder_->dimension());
    } else {
      std::size_t missing = 0;
      for (const auto& p : catalog_->list()) missing += idx.contains(p.id) ? 0 : 1;
      if (missing > 0) {
        needed = rebuild::RebuildKind::incremental;
        core::logger()->info("[engine] {} catalog products missing from index v{}; incremental rebuild",
                             missing, idx.version());
      }
    }
  }
  if (!needed) return std::nullopt;

  std::shared_future<rebuild::RebuildOutcome> fut;
  {
    std::lock_guard lock(mutation_mu_);
    fut = coordinator_->request(*needed);
  }
  auto outcome = fut.get();
  if (!outcome.ok()) {
    core::logger()->warn("[engine] startup rebuild {}: {}", rebuild::status_name(outcome.status),
                         outcome.error ? outcome.error->message : std::string("no detail"));
  }
  return outcome;
}

auto Engine::encode_query(std::string_view image_ref, Clock::time_point deadline)
    -> std::expected<embed::Embedding, core::error> {
  const auto limit = config_.search.deadline;
  auto ref = image::parse_image_ref(image_ref);
  if (!ref) return std::unexpected(ref.error());

  const auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  if (budget.count() <= 0) return timed_out("acquire", limit);

  auto img = acquirer_->acquire(*ref, budget);
  if (Clock::now() >= deadline) return timed_out("acquire", limit);
  if (!img) return std::unexpected(img.error());

  // The encode runs on its own thread so the deadline bounds it; an abandoned
  // call keeps the encoder and image alive until it returns.
  std::packaged_task<std::expected<embed::Embedding, core::error>()> task(
      [encoder = encoder_, image = *img] { return encoder->encode(*image); });
  auto pending = task.get_future();
  try {
    std::thread(std::move(task)).detach();
  } catch (const std::system_error& ex) {
    return core::make_unexpected(core::error_code::internal,
                                 std::string("cannot start encode thread: ") + ex.what(), kComponent);
  }
  if (pending.wait_until(deadline) != std::future_status::ready) {
    core::logger()->warn("[search] encode abandoned after {} ms deadline", limit.count());
    return timed_out("encode", limit);
  }
  return pending.get();
}

auto Engine::search(std::string_view image_ref, std::optional<int> top_k, std::optional<float> min_score)
    -> std::expected<std::vector<search::QueryResult>, core::error> {
  const auto started = Clock::now();
  const auto deadline = started + config_.search.deadline;
  const int k = top_k.value_or(config_.search.default_top_k);
  const float score_floor = min_score.value_or(config_.search.default_min_score);
  if (k <= 0) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "top_k must be positive, got " + std::to_string(k), kComponent);
  }
  if (!std::isfinite(score_floor)) {
    return core::make_unexpected(core::error_code::invalid_parameter, "min_score must be a finite number",
                                 kComponent);
  }

  auto query = encode_query(image_ref, deadline);
  if (!query) {
    core::logger()->debug("[search] {} failed: {}", image_ref, query.error().message);
    return std::unexpected(query.error());
  }

  const auto snap = store_->snapshot();
  if (snap->empty() && catalog_->size() > 0) {
    core::alert()->warn("[search] index v{} has no records but the catalog has {} products",
                        snap->version(), catalog_->size());
    return core::make_unexpected(core::error_code::not_found,
                                 "index has no records; catalog products become searchable "
                                 "once a rebuild succeeds",
                                 kComponent);
  }
  auto ranked = search::rank(*query, *snap, k, score_floor);
  if (!ranked) return std::unexpected(ranked.error());
  if (Clock::now() >= deadline) return timed_out("rank", config_.search.deadline);

  core::logger()->debug("[search] {} -> {} results against v{} in {} ms", image_ref, ranked->size(),
                        snap->version(),
                        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count());
  return ranked;
}

auto Engine::add_product(catalog::NewProduct entry) -> std::expected<AddProductResult, core::error> {
  std::shared_future<rebuild::RebuildOutcome> fut;
  catalog::Product product;
  {
    std::lock_guard lock(mutation_mu_);
    auto added = catalog_->append(std::move(entry));
    if (!added) return std::unexpected(added.error());
    product = std::move(*added);
    fut = coordinator_->request(rebuild::RebuildKind::incremental);
  }
  return AddProductResult{std::move(product), fut.get()};
}

auto Engine::full_rebuild() -> rebuild::RebuildOutcome {
  std::shared_future<rebuild::RebuildOutcome> fut;
  {
    std::lock_guard lock(mutation_mu_);
    fut = coordinator_->request(rebuild::RebuildKind::full);
  }
  return fut.get();
}

auto Engine::try_full_rebuild() -> std::expected<rebuild::RebuildOutcome, core::error> {
  std::shared_future<rebuild::RebuildOutcome> fut;
  {
    std::lock_guard lock(mutation_mu_);
    auto queued = coordinator_->request_if_idle(rebuild::RebuildKind::full);
    if (!queued) return std::unexpected(queued.error());
    fut = std::move(*queued);
  }
  return fut.get();
}

auto Engine::cancel_rebuilds() -> void { coordinator_->cancel_pending(); }

auto Engine::classify(std::string_view image_ref) -> std::expected<search::Classification, core::error> {
  const auto deadline = Clock::now() + config_.search.deadline;
  auto query = encode_query(image_ref, deadline);
  if (!query) return std::unexpected(query.error());
  return search::classify(*query, *store_->snapshot());
}

auto Engine::list_products() const -> std::vector<catalog::Product> { return catalog_->list(); }

auto Engine::find_product(std::string_view id) const -> std::expected<catalog::Product, core::error> {
  if (auto p = catalog_->find(id)) return *p;
  return core::make_unexpected(core::error_code::not_found, "no product with id '" + std::string(id) + "'",
                               kComponent);
}

auto Engine::snapshot() const -> index::IndexPtr { return store_->snapshot(); }

auto Engine::stats() const -> EngineStats {
  const auto snap = store_->snapshot();
  EngineStats s;
  s.index_version = snap->version();
  s.index_records = snap->size();
  s.dimension = snap->dimension();
  s.model_name = snap->model_name();
  s.catalog_size = catalog_->size();
  s.cache = acquirer_->cache().stats();
  s.rebuild = coordinator_->stats();
  return s;
}

} // namespace iris

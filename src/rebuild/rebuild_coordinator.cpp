#include "iris/rebuild/rebuild_coordinator.hpp"

#include <exception>

#include "iris/core/log.hpp"

namespace iris::rebuild {

namespace {

constexpr const char* kComponent = "rebuild";

auto kind_name(RebuildKind k) -> std::string_view {
  return k == RebuildKind::full ? "full" : "incremental";
}

auto now_millis() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

auto cancelled_outcome(RebuildKind kind, std::uint64_t version, std::string why) -> RebuildOutcome {
  RebuildOutcome out;
  out.status = RebuildStatus::cancelled;
  out.kind = kind;
  out.index_version = version;
  out.error = core::error{core::error_code::cancelled, std::move(why), kComponent};
  return out;
}

} // namespace

RebuildCoordinator::RebuildCoordinator(index::IndexStore& store, image::ImageAcquirer& acquirer,
                                       const embed::EmbeddingEncoder& encoder, CatalogSource catalog,
                                       RebuildOptions options)
    : store_(store),
      acquirer_(acquirer),
      encoder_(encoder),
      catalog_(std::move(catalog)),
      opts_(options),
      pool_(opts_.workers),
      worker_([this] { worker_loop(); }) {}

RebuildCoordinator::~RebuildCoordinator() {
  {
    std::lock_guard lock(mu_);
    stop_ = true;
    if (running_cancel_) running_cancel_->store(true);
    if (pending_) {
      pending_->promise.set_value(
          cancelled_outcome(pending_->kind, store_.version(), "coordinator shutting down"));
      pending_.reset();
    }
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

auto RebuildCoordinator::enqueue_locked(RebuildKind kind) -> std::shared_future<RebuildOutcome> {
  ++stats_.requests;
  if (!pending_) {
    pending_ = std::make_unique<Batch>();
    pending_->future = pending_->promise.get_future().share();
  }
  if (kind == RebuildKind::full) pending_->kind = RebuildKind::full;
  ++pending_->waiters;
  return pending_->future;
}

auto RebuildCoordinator::request(RebuildKind kind) -> std::shared_future<RebuildOutcome> {
  std::shared_future<RebuildOutcome> fut;
  {
    std::lock_guard lock(mu_);
    if (stop_) {
      std::promise<RebuildOutcome> p;
      p.set_value(cancelled_outcome(kind, store_.version(), "coordinator shutting down"));
      return p.get_future().share();
    }
    fut = enqueue_locked(kind);
  }
  cv_.notify_one();
  return fut;
}

auto RebuildCoordinator::request_if_idle(RebuildKind kind)
    -> std::expected<std::shared_future<RebuildOutcome>, core::error> {
  std::shared_future<RebuildOutcome> fut;
  {
    std::lock_guard lock(mu_);
    if (stop_ || running_cancel_ || pending_) {
      return core::make_unexpected(core::error_code::rebuild_in_progress,
                                   "a rebuild is already running or queued", kComponent);
    }
    fut = enqueue_locked(kind);
  }
  cv_.notify_one();
  return fut;
}

auto RebuildCoordinator::cancel_current() -> void {
  std::lock_guard lock(mu_);
  if (running_cancel_) running_cancel_->store(true);
}

auto RebuildCoordinator::cancel_pending() -> void {
  std::lock_guard lock(mu_);
  if (running_cancel_) running_cancel_->store(true);
  if (pending_) {
    auto out = cancelled_outcome(pending_->kind, store_.version(), "cancelled before start");
    record_locked(out);
    pending_->promise.set_value(std::move(out));
    pending_.reset();
  }
}

auto RebuildCoordinator::stats() const -> RebuildStats {
  std::lock_guard lock(mu_);
  auto s = stats_;
  s.pending = pending_ ? pending_->waiters : 0;
  s.running = static_cast<bool>(running_cancel_);
  return s;
}

auto RebuildCoordinator::record_locked(const RebuildOutcome& outcome) -> void {
  switch (outcome.status) {
    case RebuildStatus::published:
    case RebuildStatus::partial:   ++stats_.completed; break;
    case RebuildStatus::failed:    ++stats_.failed; break;
    case RebuildStatus::cancelled: ++stats_.cancelled; break;
  }
  stats_.last_status = outcome.status;
}

auto RebuildCoordinator::worker_loop() -> void {
  while (true) {
    std::unique_ptr<Batch> batch;
    {
      std::unique_lock lock(mu_);
      cv_.wait(lock, [this] { return stop_ || pending_ != nullptr; });
      if (stop_) return;
      batch = std::move(pending_);
      running_cancel_ = batch->cancel;
    }

    RebuildOutcome outcome;
    try {
      outcome = run(batch->kind, *batch->cancel);
    } catch (const std::exception& ex) {
      outcome = RebuildOutcome{};
      outcome.kind = batch->kind;
      outcome.index_version = store_.version();
      outcome.error = core::error{core::error_code::internal, ex.what(), kComponent};
      core::alert()->error("[rebuild] {} rebuild aborted: {}", kind_name(batch->kind), ex.what());
    }

    {
      std::lock_guard lock(mu_);
      running_cancel_.reset();
      record_locked(outcome);
    }
    batch->promise.set_value(std::move(outcome));
  }
}

auto RebuildCoordinator::run(RebuildKind kind, const std::atomic<bool>& cancel) -> RebuildOutcome {
  const auto started = std::chrono::steady_clock::now();
  const auto products = catalog_();
  const auto prior = store_.snapshot();

  auto finish = [&](RebuildOutcome out) {
    out.kind = kind;
    out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return out;
  };

  const bool compatible = prior->dimension() == encoder_.dimension() &&
                          prior->model_name() == encoder_.model_name();
  const bool reuse = kind == RebuildKind::incremental && compatible;

  core::logger()->info("[rebuild] {} rebuild started: {} products, published v{}", kind_name(kind),
                       products.size(), prior->version());

  // Per catalog slot: carried-over vector, fresh vector, or error.
  std::vector<std::optional<std::expected<embed::Embedding, core::error>>> slots(products.size());
  std::vector<std::size_t> todo;
  for (std::size_t i = 0; i < products.size(); ++i) {
    if (reuse) {
      if (auto pos = prior->position(products[i].id)) {
        auto v = prior->vector(*pos);
        slots[i] = embed::Embedding(v.begin(), v.end());
        continue;
      }
    }
    todo.push_back(i);
  }

  if (reuse && todo.empty() && prior->size() == products.size()) {
    RebuildOutcome out;
    out.status = RebuildStatus::published;
    out.index_version = prior->version();
    out.included = prior->size();
    core::logger()->debug("[rebuild] v{} already covers the catalog", prior->version());
    return finish(std::move(out));
  }

  pool_.parallel_for(0, todo.size(), [&](std::size_t j) {
    const auto& p = products[todo[j]];
    if (cancel.load()) {
      slots[todo[j]] = std::unexpected(core::error{core::error_code::cancelled, "cancelled", kComponent});
      return;
    }
    auto img = acquirer_.acquire(std::string_view(p.image_ref), opts_.fetch_timeout);
    if (!img) {
      slots[todo[j]] = std::unexpected(img.error());
      return;
    }
    slots[todo[j]] = encoder_.encode(**img);
  });

  if (cancel.load()) {
    core::logger()->warn("[rebuild] {} rebuild cancelled before publish; v{} stays published",
                         kind_name(kind), prior->version());
    return finish(cancelled_outcome(kind, prior->version(), "rebuild cancelled before publish"));
  }

  RebuildOutcome out;
  std::vector<index::IndexEntry> entries;
  entries.reserve(products.size());
  for (std::size_t i = 0; i < products.size(); ++i) {
    auto& slot = *slots[i];
    if (slot) {
      entries.push_back(index::IndexEntry{products[i], std::move(*slot)});
    } else {
      core::logger()->warn("[rebuild] excluding {}: {} ({})", products[i].id, slot.error().message,
                           core::to_string(slot.error().code));
      out.excluded.push_back(ExcludedProduct{products[i].id, slot.error()});
    }
  }
  out.included = entries.size();
  out.encoded = todo.size() - out.excluded.size();
  out.index_version = prior->version();

  const double ratio = products.empty()
                           ? 0.0
                           : static_cast<double>(out.excluded.size()) / static_cast<double>(products.size());
  if ((!products.empty() && entries.empty()) || ratio > opts_.max_failure_ratio) {
    out.status = RebuildStatus::failed;
    out.error = core::error{core::error_code::rebuild_failed,
                            std::to_string(out.excluded.size()) + " of " + std::to_string(products.size()) +
                                " products failed (threshold " + std::to_string(opts_.max_failure_ratio) + ")",
                            kComponent};
    core::alert()->error("[rebuild] {} rebuild failed: {}; v{} retained", kind_name(kind),
                         out.error->message, prior->version());
    return finish(std::move(out));
  }

  index::IndexMeta meta{prior->version() + 1, encoder_.model_name(),
                        static_cast<std::uint32_t>(encoder_.dimension()), now_millis()};
  auto built = index::Index::build(std::move(meta), std::move(entries));
  if (!built) {
    out.status = RebuildStatus::failed;
    out.error = built.error();
    core::alert()->error("[rebuild] assembled index is invalid: {}", built.error().message);
    return finish(std::move(out));
  }

  if (cancel.load()) {
    return finish(cancelled_outcome(kind, prior->version(), "rebuild cancelled before publish"));
  }

  auto next = std::make_shared<const index::Index>(std::move(*built));
  if (auto pub = store_.publish(next); !pub) {
    out.status = RebuildStatus::failed;
    out.error = pub.error();
    core::alert()->error("[rebuild] publish of v{} failed: {}", next->version(), pub.error().message);
    return finish(std::move(out));
  }

  out.status = out.excluded.empty() ? RebuildStatus::published : RebuildStatus::partial;
  out.index_version = next->version();
  core::logger()->info("[rebuild] {} v{} ({} products, {} encoded, {} excluded)", status_name(out.status),
                       out.index_version, out.included, out.encoded, out.excluded.size());
  return finish(std::move(out));
}

} // namespace iris::rebuild

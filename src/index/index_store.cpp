#include "iris/index/index_store.hpp"

#include <string>

#include "iris/core/atomic_file.hpp"
#include "iris/core/log.hpp"

namespace iris::index {

namespace {
constexpr const char* kComponent = "index.store";
} // namespace

IndexStore::IndexStore(std::filesystem::path file, IndexFileOptions file_options)
    : file_(std::move(file)), file_options_(file_options), current_(std::make_shared<const Index>()) {}

auto IndexStore::load() -> std::expected<IndexPtr, core::error> {
  std::lock_guard publish_lock(publish_mu_);
  auto bytes = core::read_file(file_);
  if (!bytes) {
    auto err = bytes.error();
    if (err.code == core::error_code::not_found) {
      core::logger()->info("[index] no index file at {}", file_.string());
    } else {
      core::alert()->error("[index] cannot read index file {}: {}", file_.string(), err.message);
      err.code = core::error_code::corrupt_index;
    }
    err.component = kComponent;
    return std::unexpected(std::move(err));
  }

  auto loaded = decode_index(*bytes);
  if (!loaded) {
    auto err = loaded.error();
    core::alert()->error("[index] corrupt index file {}: {}", file_.string(), err.message);
    err.code = core::error_code::corrupt_index;
    err.component = kComponent;
    // Versions must keep increasing past the damaged file.
    if (auto floor = peek_index_version(*bytes); floor && *floor > snapshot()->version()) {
      auto empty = Index::build(IndexMeta{*floor, {}, 0, 0}, {});
      if (empty) {
        std::lock_guard lock(snapshot_mu_);
        current_ = std::make_shared<const Index>(std::move(*empty));
      }
      core::logger()->info("[index] header of damaged file names v{}; next publish continues after it",
                           *floor);
    }
    return std::unexpected(std::move(err));
  }

  auto ptr = std::make_shared<const Index>(std::move(*loaded));
  {
    std::lock_guard lock(snapshot_mu_);
    current_ = ptr;
  }
  core::logger()->info("[index] loaded v{} ({} records, dim {}, model {})", ptr->version(), ptr->size(),
                       ptr->dimension(), ptr->model_name());
  return ptr;
}

auto IndexStore::publish(IndexPtr next) -> std::expected<void, core::error> {
  if (!next) {
    return core::make_unexpected(core::error_code::invalid_parameter, "cannot publish a null index",
                                 kComponent);
  }
  std::lock_guard publish_lock(publish_mu_);
  const auto prior = snapshot()->version();
  if (next->version() <= prior) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "index version " + std::to_string(next->version()) +
                                     " does not supersede published v" + std::to_string(prior),
                                 kComponent);
  }

  if (auto w = write_index_file(file_, *next, file_options_); !w) {
    auto err = w.error();
    err.component = kComponent;
    core::logger()->error("[index] failed to persist v{}: {}", next->version(), err.message);
    return std::unexpected(std::move(err));
  }

  {
    std::lock_guard lock(snapshot_mu_);
    current_ = next;
  }
  core::logger()->info("[index] published v{} ({} records)", next->version(), next->size());
  return {};
}

auto IndexStore::snapshot() const -> IndexPtr {
  std::lock_guard lock(snapshot_mu_);
  return current_;
}

} // namespace iris::index

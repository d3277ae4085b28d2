#include "iris/catalog/catalog_store.hpp"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "iris/core/atomic_file.hpp"
#include "iris/core/log.hpp"

namespace iris::catalog {

namespace {

constexpr const char* kComponent = "catalog.store";

auto trim(std::string_view s) -> std::string {
  const auto* ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return std::string(s.substr(b, e - b + 1));
}

auto to_json(const std::vector<Product>& products) -> std::string {
  auto arr = nlohmann::json::array();
  for (const auto& p : products) {
    arr.push_back({{"id", p.id}, {"name", p.name}, {"category", p.category}, {"image_url", p.image_ref}});
  }
  return arr.dump(2) + "\n";
}

auto now_millis() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

auto slugify(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  bool pending_dash = false;
  for (unsigned char c : text) {
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      if (pending_dash && !out.empty()) out.push_back('-');
      out.push_back(static_cast<char>(c));
      pending_dash = false;
    } else if (c >= 'A' && c <= 'Z') {
      if (pending_dash && !out.empty()) out.push_back('-');
      out.push_back(static_cast<char>(c - 'A' + 'a'));
      pending_dash = false;
    } else {
      pending_dash = true;
    }
  }
  return out.empty() ? std::string("product") : out;
}

auto make_product_id(std::string_view category, std::int64_t unix_millis) -> std::string {
  return slugify(category) + "-" + std::to_string(unix_millis);
}

CatalogStore::CatalogStore(std::filesystem::path file) : file_(std::move(file)) {}

auto CatalogStore::open(std::filesystem::path file)
    -> std::expected<std::unique_ptr<CatalogStore>, core::error> {
  std::unique_ptr<CatalogStore> store(new CatalogStore(std::move(file)));

  auto bytes = core::read_file(store->file_);
  if (!bytes) {
    if (bytes.error().code == core::error_code::not_found) {
      core::logger()->info("[catalog] {} not found; starting with an empty catalog",
                           store->file_.string());
      return store;
    }
    return std::unexpected(bytes.error());
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(bytes->begin(), bytes->end());
  } catch (const nlohmann::json::exception& ex) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "malformed catalog " + store->file_.string() + ": " + ex.what(),
                                 kComponent);
  }
  if (!doc.is_array()) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "catalog root must be a JSON array: " + store->file_.string(),
                                 kComponent);
  }

  for (std::size_t i = 0; i < doc.size(); ++i) {
    const auto& item = doc[i];
    Product p;
    try {
      p.id = item.at("id").get<std::string>();
      p.name = item.at("name").get<std::string>();
      p.category = item.at("category").get<std::string>();
      p.image_ref = item.at("image_url").get<std::string>();
    } catch (const nlohmann::json::exception& ex) {
      return core::make_unexpected(core::error_code::invalid_parameter,
                                   "catalog entry " + std::to_string(i) + ": " + ex.what(),
                                   kComponent);
    }
    if (p.id.empty() || store->by_id_.contains(p.id)) {
      return core::make_unexpected(core::error_code::invalid_parameter,
                                   "catalog entry " + std::to_string(i) + " has an empty or duplicate id '" +
                                       p.id + "'",
                                   kComponent);
    }
    store->by_id_.emplace(p.id, store->products_.size());
    store->products_.push_back(std::move(p));
  }
  core::logger()->info("[catalog] loaded {} products from {}", store->products_.size(),
                       store->file_.string());
  return store;
}

auto CatalogStore::unique_id_locked(std::string base) const -> std::string {
  if (!by_id_.contains(base)) return base;
  for (std::size_t n = 2;; ++n) {
    auto candidate = base + "-" + std::to_string(n);
    if (!by_id_.contains(candidate)) return candidate;
  }
}

auto CatalogStore::commit_locked(Product product) -> std::expected<Product, core::error> {
  auto next = products_;
  next.push_back(product);
  if (auto w = core::write_file_atomic(file_, to_json(next)); !w) {
    auto err = w.error();
    err.component = kComponent;
    return std::unexpected(std::move(err));
  }
  by_id_.emplace(product.id, products_.size());
  products_ = std::move(next);
  return product;
}

auto CatalogStore::append(NewProduct entry) -> std::expected<Product, core::error> {
  Product p{{}, trim(entry.name), trim(entry.category), trim(entry.image_ref)};
  if (p.name.empty() || p.category.empty() || p.image_ref.empty()) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "name, category and image reference are required", kComponent);
  }

  std::lock_guard lock(mu_);
  p.id = unique_id_locked(make_product_id(p.category, now_millis()));
  auto committed = commit_locked(std::move(p));
  if (committed) {
    core::logger()->info("[catalog] added {} ({}, {})", committed->id, committed->name,
                         committed->category);
  }
  return committed;
}

auto CatalogStore::append_with_id(Product product) -> std::expected<Product, core::error> {
  if (product.id.empty() || product.name.empty() || product.category.empty() ||
      product.image_ref.empty()) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "id, name, category and image reference are required", kComponent);
  }
  std::lock_guard lock(mu_);
  if (by_id_.contains(product.id)) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "duplicate product id '" + product.id + "'", kComponent);
  }
  return commit_locked(std::move(product));
}

auto CatalogStore::list() const -> std::vector<Product> {
  std::lock_guard lock(mu_);
  return products_;
}

auto CatalogStore::find(std::string_view id) const -> std::optional<Product> {
  std::lock_guard lock(mu_);
  auto it = by_id_.find(std::string(id));
  if (it == by_id_.end()) return std::nullopt;
  return products_[it->second];
}

auto CatalogStore::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return products_.size();
}

} // namespace iris::catalog

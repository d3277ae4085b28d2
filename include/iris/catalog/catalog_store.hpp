#pragma once

/** \file catalog_store.hpp
 *  \brief Durable, append-only product catalog (products.json).
 *
 * The catalog is the source of truth for which products exist; the vector
 * index is derived from it. Products are immutable once appended and are
 * never removed. Insertion order is preserved and is the tie-break order used
 * by ranking.
 *
 * On disk: a JSON array of {"id", "name", "category", "image_url"} objects,
 * replaced atomically on every append.
 *
 * Thread-safety: all member functions are safe for concurrent use.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "iris/error.hpp"

namespace iris::catalog {

struct Product {
  std::string id;
  std::string name;
  std::string category;
  std::string image_ref;   /**< local path or URL, as supplied */

  friend bool operator==(const Product&, const Product&) = default;
};

/** \brief Fields supplied by a caller; the id is assigned by the store. */
struct NewProduct {
  std::string name;
  std::string category;
  std::string image_ref;
};

/** \brief Lowercase ASCII slug: alphanumerics kept, runs of anything else become one '-'. */
auto slugify(std::string_view text) -> std::string;

/** \brief "<slug(category)>-<unix_millis>". */
auto make_product_id(std::string_view category, std::int64_t unix_millis) -> std::string;

class CatalogStore {
public:
  /** \brief Load the catalog at \p file; a missing file is an empty catalog.
   *
   * Errors: io_failed (unreadable or malformed JSON), invalid_parameter
   * (entry missing a field, or duplicate id).
   */
  static auto open(std::filesystem::path file) -> std::expected<std::unique_ptr<CatalogStore>, core::error>;

  /** \brief Validate, assign an id, persist, then make visible.
   *
   * The in-memory catalog only changes after the file replace succeeded.
   * Errors: invalid_parameter (empty field), io_failed.
   */
  auto append(NewProduct entry) -> std::expected<Product, core::error>;

  /** \brief Append with a caller-chosen id (imports, fixtures). */
  auto append_with_id(Product product) -> std::expected<Product, core::error>;

  [[nodiscard]] auto list() const -> std::vector<Product>;
  [[nodiscard]] auto find(std::string_view id) const -> std::optional<Product>;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto path() const -> const std::filesystem::path& { return file_; }

private:
  explicit CatalogStore(std::filesystem::path file);

  auto unique_id_locked(std::string base) const -> std::string;
  auto commit_locked(Product product) -> std::expected<Product, core::error>;

  std::filesystem::path file_;
  mutable std::mutex mu_;
  std::vector<Product> products_;
  std::unordered_map<std::string, std::size_t> by_id_;
};

} // namespace iris::catalog

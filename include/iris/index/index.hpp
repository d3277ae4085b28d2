#pragma once

/** \file index.hpp
 *  \brief Immutable, versioned collection of product embeddings.
 *
 * An Index is built once (by a rebuild or by loading the index file) and never
 * mutated afterwards; it is shared between readers as
 * std::shared_ptr<const Index>.
 *
 * Invariants enforced by Index::build:
 * - every vector has exactly meta.dimension components and unit L2 norm
 *   (within kNormTolerance)
 * - product ids are unique and non-empty
 * - entry order is preserved; position() is the catalog insertion order used
 *   to break ranking ties
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "iris/catalog/catalog_store.hpp"
#include "iris/error.hpp"

namespace iris::index {

inline constexpr double kNormTolerance = 1e-3;

struct IndexMeta {
  std::uint64_t version{0};          /**< strictly increasing across publishes */
  std::string model_name;            /**< encoder that produced the vectors */
  std::uint32_t dimension{0};
  std::int64_t created_at_ms{0};     /**< unix milliseconds */
};

/** \brief One catalog product with its embedding. */
struct IndexEntry {
  catalog::Product product;
  std::vector<float> vector;
};

class Index {
public:
  /** \brief Empty index (version 0, no model). */
  Index() = default;

  /** \brief Validate and freeze entries.
   *
   * Errors: corrupt_index (wrong vector length, non-unit or non-finite
   * vector, empty or duplicate id, zero dimension with entries present).
   */
  static auto build(IndexMeta meta, std::vector<IndexEntry> entries)
      -> std::expected<Index, core::error>;

  [[nodiscard]] auto meta() const noexcept -> const IndexMeta& { return meta_; }
  [[nodiscard]] auto version() const noexcept -> std::uint64_t { return meta_.version; }
  [[nodiscard]] auto dimension() const noexcept -> std::uint32_t { return meta_.dimension; }
  [[nodiscard]] auto model_name() const noexcept -> const std::string& { return meta_.model_name; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return products_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return products_.empty(); }

  [[nodiscard]] auto product(std::size_t pos) const -> const catalog::Product& { return products_[pos]; }
  [[nodiscard]] auto vector(std::size_t pos) const -> std::span<const float> {
    return {vectors_.data() + pos * meta_.dimension, meta_.dimension};
  }

  /** \brief Position of a product id, if present. */
  [[nodiscard]] auto position(std::string_view product_id) const -> std::optional<std::size_t>;
  [[nodiscard]] auto contains(std::string_view product_id) const -> bool {
    return position(product_id).has_value();
  }

  /** \brief Copy of one entry (product + vector). */
  [[nodiscard]] auto entry(std::size_t pos) const -> IndexEntry;

private:
  IndexMeta meta_;
  std::vector<catalog::Product> products_;
  std::vector<float> vectors_;                       /**< size() * dimension, row-major */
  std::unordered_map<std::string, std::size_t> by_id_;
};

using IndexPtr = std::shared_ptr<const Index>;

} // namespace iris::index

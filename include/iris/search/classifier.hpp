#pragma once

/** \file classifier.hpp
 *  \brief Nearest-centroid category prediction over an index snapshot.
 */

#include <expected>
#include <span>
#include <string>
#include <vector>

#include "iris/error.hpp"
#include "iris/index/index.hpp"

namespace iris::search {

struct CategoryCentroid {
  std::string category;
  std::vector<float> centroid;   /**< unit length */
  std::size_t members{0};
};

struct Classification {
  std::string category;
  float score{0.0f};              /**< cosine to the winning centroid */
  std::string suggested_name;     /**< "Uploaded <category>" */
};

/** \brief Per-category normalized mean vectors, in first-seen category order.
 *
 * Categories whose members cancel out to a zero mean are omitted.
 */
auto category_centroids(const index::Index& index) -> std::vector<CategoryCentroid>;

/** \brief Best-matching category for \p query.
 *
 * Errors: not_found (no usable centroid), corrupt_index (dimension mismatch).
 * Ties go to the category seen first in the index.
 */
auto classify(std::span<const float> query, const index::Index& index)
    -> std::expected<Classification, core::error>;

} // namespace iris::search

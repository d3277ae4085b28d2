#pragma once

/** \file ranker.hpp
 *  \brief Similarity Ranker: exhaustive cosine scan over an index snapshot.
 *
 * rank() is a pure function of its arguments and is safe to call concurrently.
 * Scores are the dot product of unit vectors, clamped to [-1, 1]. Entries
 * scoring below min_score are dropped; the rest are ordered by descending score
 * with ties broken by index position (catalog insertion order), then truncated
 * to top_k.
 *
 * Complexity: O(n * d) scoring + O(n log k) selection.
 */

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "iris/error.hpp"
#include "iris/index/index.hpp"

namespace iris::search {

struct QueryResult {
  std::string product_id;
  std::string name;
  std::string category;
  std::string image_ref;
  float score{0.0f};
  std::size_t position{0};   /**< index position; the tie-break key */
};

/** \brief Rank every index entry against \p query.
 *
 * Errors:
 * - invalid_parameter: top_k <= 0
 * - corrupt_index: query length differs from the index dimension (also
 *   raised on the alert channel)
 */
auto rank(std::span<const float> query, const index::Index& index, int top_k, float min_score)
    -> std::expected<std::vector<QueryResult>, core::error>;

} // namespace iris::search

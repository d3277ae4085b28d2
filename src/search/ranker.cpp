#include "iris/search/ranker.hpp"

#include <algorithm>
#include <utility>

#include "iris/core/log.hpp"
#include "iris/kernels/distance.hpp"

namespace iris::search {

namespace {
constexpr const char* kComponent = "search.rank";

struct Candidate {
  float score;
  std::size_t pos;
};

// Higher score first; equal scores keep index order.
inline bool ranks_before(const Candidate& a, const Candidate& b) noexcept {
  if (a.score != b.score) return a.score > b.score;
  return a.pos < b.pos;
}
} // namespace

auto rank(std::span<const float> query, const index::Index& index, int top_k, float min_score)
    -> std::expected<std::vector<QueryResult>, core::error> {
  if (top_k <= 0) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "top_k must be positive, got " + std::to_string(top_k), kComponent);
  }
  if (index.empty()) return std::vector<QueryResult>{};
  if (query.size() != index.dimension()) {
    core::alert()->error("[rank] query dimension {} does not match index v{} dimension {}", query.size(),
                         index.version(), index.dimension());
    return core::make_unexpected(core::error_code::corrupt_index,
                                 "query has " + std::to_string(query.size()) +
                                     " components, index dimension is " + std::to_string(index.dimension()),
                                 kComponent);
  }

  std::vector<Candidate> candidates;
  candidates.reserve(index.size());
  for (std::size_t i = 0; i < index.size(); ++i) {
    const float s = kernels::unit_cosine(query, index.vector(i));
    if (s >= min_score) candidates.push_back({s, i});
  }

  const auto k = std::min(candidates.size(), static_cast<std::size_t>(top_k));
  std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(k),
                    candidates.end(), ranks_before);

  std::vector<QueryResult> out;
  out.reserve(k);
  for (std::size_t i = 0; i < k; ++i) {
    const auto& p = index.product(candidates[i].pos);
    out.push_back(QueryResult{p.id, p.name, p.category, p.image_ref, candidates[i].score, candidates[i].pos});
  }
  return out;
}

} // namespace iris::search

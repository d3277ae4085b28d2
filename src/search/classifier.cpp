#include "iris/search/classifier.hpp"

#include <unordered_map>

#include "iris/core/log.hpp"
#include "iris/kernels/distance.hpp"

namespace iris::search {

namespace {
constexpr const char* kComponent = "search.classify";
} // namespace

auto category_centroids(const index::Index& index) -> std::vector<CategoryCentroid> {
  const std::size_t dim = index.dimension();
  std::vector<CategoryCentroid> out;
  std::vector<std::vector<double>> sums;
  std::unordered_map<std::string, std::size_t> slot;

  for (std::size_t i = 0; i < index.size(); ++i) {
    const auto& category = index.product(i).category;
    auto [it, inserted] = slot.emplace(category, out.size());
    if (inserted) {
      out.push_back(CategoryCentroid{category, {}, 0});
      sums.emplace_back(dim, 0.0);
    }
    auto& acc = sums[it->second];
    const auto v = index.vector(i);
    for (std::size_t d = 0; d < dim; ++d) acc[d] += v[d];
    ++out[it->second].members;
  }

  std::vector<CategoryCentroid> usable;
  usable.reserve(out.size());
  for (std::size_t c = 0; c < out.size(); ++c) {
    out[c].centroid.assign(sums[c].begin(), sums[c].end());
    if (kernels::normalize_inplace(out[c].centroid)) usable.push_back(std::move(out[c]));
  }
  return usable;
}

auto classify(std::span<const float> query, const index::Index& index)
    -> std::expected<Classification, core::error> {
  if (!index.empty() && query.size() != index.dimension()) {
    core::alert()->error("[classify] query dimension {} does not match index v{} dimension {}",
                         query.size(), index.version(), index.dimension());
    return core::make_unexpected(core::error_code::corrupt_index,
                                 "query dimension does not match the index", kComponent);
  }
  const auto centroids = category_centroids(index);
  if (centroids.empty()) {
    return core::make_unexpected(core::error_code::not_found, "index has no categories to compare with",
                                 kComponent);
  }

  const CategoryCentroid* best = nullptr;
  float best_score = -2.0f;
  for (const auto& c : centroids) {
    const float s = kernels::unit_cosine(query, c.centroid);
    if (s > best_score) {
      best_score = s;
      best = &c;
    }
  }
  return Classification{best->category, best_score, "Uploaded " + best->category};
}

} // namespace iris::search

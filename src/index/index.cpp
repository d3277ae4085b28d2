#include "iris/index/index.hpp"

#include <cmath>

#include "iris/kernels/distance.hpp"

namespace iris::index {

namespace {
constexpr const char* kComponent = "index.model";
} // namespace

auto Index::build(IndexMeta meta, std::vector<IndexEntry> entries) -> std::expected<Index, core::error> {
  if (!entries.empty() && meta.dimension == 0) {
    return core::make_unexpected(core::error_code::corrupt_index,
                                 "index with entries must have a non-zero dimension", kComponent);
  }

  Index idx;
  idx.meta_ = std::move(meta);
  idx.products_.reserve(entries.size());
  idx.vectors_.reserve(entries.size() * idx.meta_.dimension);
  idx.by_id_.reserve(entries.size());

  for (auto& e : entries) {
    if (e.vector.size() != idx.meta_.dimension) {
      return core::make_unexpected(core::error_code::corrupt_index,
                                   "vector for '" + e.product.id + "' has " +
                                       std::to_string(e.vector.size()) + " components, index dimension is " +
                                       std::to_string(idx.meta_.dimension),
                                   kComponent);
    }
    const double norm = kernels::l2_norm(e.vector);
    if (!std::isfinite(norm) || std::abs(norm - 1.0) > kNormTolerance) {
      return core::make_unexpected(core::error_code::corrupt_index,
                                   "vector for '" + e.product.id + "' is not unit length (norm " +
                                       std::to_string(norm) + ")",
                                   kComponent);
    }
    if (e.product.id.empty()) {
      return core::make_unexpected(core::error_code::corrupt_index, "entry with empty product id",
                                   kComponent);
    }
    if (!idx.by_id_.emplace(e.product.id, idx.products_.size()).second) {
      return core::make_unexpected(core::error_code::corrupt_index,
                                   "duplicate product id '" + e.product.id + "'", kComponent);
    }
    idx.vectors_.insert(idx.vectors_.end(), e.vector.begin(), e.vector.end());
    idx.products_.push_back(std::move(e.product));
  }
  return idx;
}

auto Index::position(std::string_view product_id) const -> std::optional<std::size_t> {
  auto it = by_id_.find(std::string(product_id));
  if (it == by_id_.end()) return std::nullopt;
  return it->second;
}

auto Index::entry(std::size_t pos) const -> IndexEntry {
  auto v = vector(pos);
  return IndexEntry{products_[pos], std::vector<float>(v.begin(), v.end())};
}

} // namespace iris::index

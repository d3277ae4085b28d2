#pragma once

/** \file distance.hpp
 *  \brief Scalar reference similarity kernels over float32 embeddings.
 *
 * Preconditions
 * - a.size() == b.size() > 0 (callers check dimensionality; the kernels do not)
 * - All inputs are finite
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace iris::kernels {

/** \brief Inner product: sum(a[i] * b[i]). For unit vectors this is the cosine. O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  // 4-lane partial sums, fixed reduction order.
  float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  const std::size_t d = a.size();
  const std::size_t blocked = d - d % 4;
  for (std::size_t i = 0; i < blocked; i += 4) {
    for (std::size_t lane = 0; lane < 4; ++lane) acc[lane] += a[i + lane] * b[i + lane];
  }
  float total = (acc[0] + acc[2]) + (acc[1] + acc[3]);
  for (std::size_t i = blocked; i < d; ++i) total += a[i] * b[i];
  return total;
}

/** \brief Euclidean norm, accumulated in double. O(d). */
inline double l2_norm(std::span<const float> a) noexcept {
  double s = 0.0;
  for (float v : a) s += static_cast<double>(v) * static_cast<double>(v);
  return std::sqrt(s);
}

/** \brief Scale a in place to unit length.
 *  \return false (a untouched) when the norm is zero or not finite
 */
inline bool normalize_inplace(std::span<float> a) noexcept {
  const double norm = l2_norm(a);
  if (!(norm > 0.0) || !std::isfinite(norm)) return false;
  for (auto& v : a) v = static_cast<float>(static_cast<double>(v) / norm);
  return true;
}

/** \brief Cosine similarity of two vectors already normalized to unit length,
 *  clamped to [-1, 1] against rounding. O(d).
 */
inline float unit_cosine(std::span<const float> a, std::span<const float> b) noexcept {
  const float dot = inner_product(a, b);
  if (dot > 1.0f) return 1.0f;
  if (dot < -1.0f) return -1.0f;
  return dot;
}

} // namespace iris::kernels

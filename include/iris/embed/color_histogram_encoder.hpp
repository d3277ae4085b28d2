#pragma once

/** \file color_histogram_encoder.hpp
 *  \brief Built-in encoder: spatial HSV color histograms (OpenCV imgproc).
 *
 * The image is resized to a fixed working size, converted to HSV and split into
 * a grid x grid layout. Each cell contributes an h_bins * s_bins * v_bins
 * histogram of pixel fractions; the concatenation is square-rooted (Hellinger
 * mapping) so that cosine similarity behaves like Bhattacharyya affinity.
 *
 * Deterministic; needs no model files. Suitable as the default capability and
 * as a fallback when no learned model is configured.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "iris/embed/image_encoder.hpp"

namespace iris::embed {

struct ColorHistogramOptions {
  std::uint32_t h_bins{8};
  std::uint32_t s_bins{3};
  std::uint32_t v_bins{3};
  std::uint32_t grid{2};             /**< cells per side */
  std::uint32_t working_side{128};   /**< image is resized to working_side^2 first */
};

class ColorHistogramEncoder final : public ImageEncoder {
public:
  explicit ColorHistogramEncoder(ColorHistogramOptions options = {});

  [[nodiscard]] auto model_name() const -> std::string override;
  [[nodiscard]] auto dimension() const noexcept -> std::size_t override;

  auto encode_raw(const image::DecodedImage& img)
      -> std::expected<std::vector<float>, core::error> override;

private:
  ColorHistogramOptions opts_;
};

} // namespace iris::embed

#pragma once

/** \file decoded_image.hpp
 *  \brief Decoded raster images and the byte-level decoder (OpenCV imgcodecs).
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "iris/error.hpp"

namespace iris::image {

/** \brief Interleaved 8-bit RGB pixels, row-major, no padding.
 *
 * Immutable once produced; shared between the cache and callers through
 * std::shared_ptr<const DecodedImage>.
 */
struct DecodedImage {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::uint32_t channels{3};
  std::vector<std::uint8_t> pixels;   /**< width * height * channels bytes */

  [[nodiscard]] auto size_bytes() const noexcept -> std::size_t { return pixels.size(); }
};

using DecodedImagePtr = std::shared_ptr<const DecodedImage>;

/** \brief Upper bound on decoded width/height; larger images are rejected. */
inline constexpr std::uint32_t kMaxImageSide = 16384;

/** \brief Decode encoded bytes (JPEG, PNG, BMP, WebP, ... as supported by
 *  the linked OpenCV build) into RGB.
 *
 * Errors: invalid_image for empty input, unrecognized/corrupt/truncated data,
 * or dimensions beyond kMaxImageSide.
 */
auto decode_image(std::span<const std::uint8_t> encoded) -> std::expected<DecodedImage, core::error>;

} // namespace iris::image

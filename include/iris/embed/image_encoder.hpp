#pragma once

/** \file image_encoder.hpp
 *  \brief Embedding encoder: external model seam plus the normalizing wrapper.
 *
 * ImageEncoder is the narrow interface to a pretrained capability (ONNX model,
 * hand-crafted descriptor, or a stub in tests). It returns raw model output.
 *
 * EmbeddingEncoder is what the rest of the engine calls. It owns the two
 * guarantees the index depends on:
 * - every vector has exactly dimension() components
 * - every vector has unit L2 norm
 * Any backend failure, wrong-length output, non-finite value or zero vector is
 * reported as encoding_failure, never coerced.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "iris/error.hpp"
#include "iris/image/decoded_image.hpp"

namespace iris::embed {

using Embedding = std::vector<float>;

class ImageEncoder {
public:
  virtual ~ImageEncoder() = default;

  /** \brief Identifier of the model and its version; stored in the index header. */
  [[nodiscard]] virtual auto model_name() const -> std::string = 0;

  /** \brief Length of every vector produced by encode_raw. */
  [[nodiscard]] virtual auto dimension() const noexcept -> std::size_t = 0;

  /** \brief Raw (unnormalized) model output for one image.
   *
   * Thread-safety: implementations must tolerate concurrent calls.
   */
  virtual auto encode_raw(const image::DecodedImage& img)
      -> std::expected<std::vector<float>, core::error> = 0;
};

class EmbeddingEncoder {
public:
  explicit EmbeddingEncoder(std::shared_ptr<ImageEncoder> backend);

  /** \brief Encode and L2-normalize one image. */
  auto encode(const image::DecodedImage& img) const -> std::expected<Embedding, core::error>;

  [[nodiscard]] auto model_name() const -> std::string { return model_name_; }
  [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dimension_; }

private:
  std::shared_ptr<ImageEncoder> backend_;
  std::string model_name_;
  std::size_t dimension_;
};

} // namespace iris::embed

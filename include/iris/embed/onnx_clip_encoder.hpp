#pragma once

/** \file onnx_clip_encoder.hpp
 *  \brief CLIP-style image tower served through ONNX Runtime (iris_onnx target).
 *
 * Expects a model with one float input shaped [1, 3, S, S] (NCHW) and a first
 * output shaped [1, D]. Preprocessing follows CLIP: shorter side resized to S
 * (bicubic), center crop, scale to [0, 1], per-channel mean/std normalization.
 */

#include <array>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime/onnxruntime_cxx_api.h>

#include "iris/embed/image_encoder.hpp"

namespace iris::embed {

struct OnnxClipOptions {
  std::filesystem::path model_path;
  std::string model_name;            /**< empty = derived from the file stem */
  int input_side{224};
  int intra_op_threads{1};
  std::array<float, 3> mean{0.48145466f, 0.4578275f, 0.40821073f};
  std::array<float, 3> stddev{0.26862954f, 0.26130258f, 0.27577711f};
};

class OnnxClipEncoder final : public ImageEncoder {
public:
  /** \brief Load the model and probe its output dimension.
   *
   * Errors: not_found (model file missing), encoding_failure (session creation
   * failed or the output shape is not [1, D]).
   */
  static auto open(OnnxClipOptions options) -> std::expected<std::unique_ptr<OnnxClipEncoder>, core::error>;

  [[nodiscard]] auto model_name() const -> std::string override { return model_name_; }
  [[nodiscard]] auto dimension() const noexcept -> std::size_t override { return dimension_; }

  auto encode_raw(const image::DecodedImage& img)
      -> std::expected<std::vector<float>, core::error> override;

private:
  explicit OnnxClipEncoder(OnnxClipOptions options);

  auto preprocess(const image::DecodedImage& img) const -> std::expected<std::vector<float>, core::error>;

  OnnxClipOptions opts_;
  Ort::Env env_;
  Ort::SessionOptions session_options_;
  Ort::Session session_{nullptr};
  std::string input_name_;
  std::string output_name_;
  std::string model_name_;
  std::size_t dimension_{0};
};

} // namespace iris::embed

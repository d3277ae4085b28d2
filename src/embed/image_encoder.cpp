#include "iris/embed/image_encoder.hpp"

#include <cmath>
#include <exception>

#include "iris/kernels/distance.hpp"

namespace iris::embed {

namespace {
constexpr const char* kComponent = "embed.encode";
} // namespace

EmbeddingEncoder::EmbeddingEncoder(std::shared_ptr<ImageEncoder> backend)
    : backend_(std::move(backend)),
      model_name_(backend_ ? backend_->model_name() : std::string{}),
      dimension_(backend_ ? backend_->dimension() : 0) {}

auto EmbeddingEncoder::encode(const image::DecodedImage& img) const
    -> std::expected<Embedding, core::error> {
  if (!backend_ || dimension_ == 0) {
    return core::make_unexpected(core::error_code::encoding_failure, "no encoder configured",
                                 kComponent);
  }
  if (img.width == 0 || img.height == 0 ||
      img.pixels.size() != static_cast<std::size_t>(img.width) * img.height * img.channels) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 "malformed decoded image buffer", kComponent);
  }

  std::expected<std::vector<float>, core::error> raw;
  try {
    raw = backend_->encode_raw(img);
  } catch (const std::exception& ex) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 model_name_ + " threw: " + ex.what(), kComponent);
  }
  if (!raw) {
    auto err = raw.error();
    err.code = core::error_code::encoding_failure;
    err.message = model_name_ + ": " + err.message;
    return std::unexpected(std::move(err));
  }

  Embedding v = std::move(*raw);
  if (v.size() != dimension_) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 model_name_ + " returned " + std::to_string(v.size()) +
                                     " values, expected " + std::to_string(dimension_),
                                 kComponent);
  }
  for (float x : v) {
    if (!std::isfinite(x)) {
      return core::make_unexpected(core::error_code::encoding_failure,
                                   model_name_ + " returned a non-finite value", kComponent);
    }
  }
  if (!kernels::normalize_inplace(v)) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 model_name_ + " returned a zero vector", kComponent);
  }
  return v;
}

} // namespace iris::embed

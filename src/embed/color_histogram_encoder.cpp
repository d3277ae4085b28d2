#include "iris/embed/color_histogram_encoder.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace iris::embed {

namespace {
constexpr const char* kComponent = "embed.color_hist";
// OpenCV 8-bit HSV: H in [0, 180), S and V in [0, 256).
constexpr int kHueRange = 180;
constexpr int kSatValRange = 256;
} // namespace

ColorHistogramEncoder::ColorHistogramEncoder(ColorHistogramOptions options) : opts_(options) {
  opts_.h_bins = std::max<std::uint32_t>(opts_.h_bins, 1);
  opts_.s_bins = std::max<std::uint32_t>(opts_.s_bins, 1);
  opts_.v_bins = std::max<std::uint32_t>(opts_.v_bins, 1);
  opts_.grid = std::max<std::uint32_t>(opts_.grid, 1);
  opts_.working_side = std::max(opts_.working_side, opts_.grid);
}

auto ColorHistogramEncoder::model_name() const -> std::string {
  return "color-hsv-" + std::to_string(opts_.h_bins) + "x" + std::to_string(opts_.s_bins) + "x" +
         std::to_string(opts_.v_bins) + "-g" + std::to_string(opts_.grid) + "-v1";
}

auto ColorHistogramEncoder::dimension() const noexcept -> std::size_t {
  return static_cast<std::size_t>(opts_.h_bins) * opts_.s_bins * opts_.v_bins * opts_.grid *
         opts_.grid;
}

auto ColorHistogramEncoder::encode_raw(const image::DecodedImage& img)
    -> std::expected<std::vector<float>, core::error> {
  if (img.channels != 3) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 "expected 3-channel RGB input, got " +
                                     std::to_string(img.channels) + " channels",
                                 kComponent);
  }

  const int side = static_cast<int>(opts_.working_side);
  cv::Mat hsv;
  try {
    // cv::Mat over the caller's buffer; OpenCV does not write through it.
    cv::Mat rgb(static_cast<int>(img.height), static_cast<int>(img.width), CV_8UC3,
                const_cast<std::uint8_t*>(img.pixels.data()));
    cv::Mat small;
    cv::resize(rgb, small, cv::Size(side, side), 0, 0, cv::INTER_AREA);
    cv::cvtColor(small, hsv, cv::COLOR_RGB2HSV);
  } catch (const cv::Exception& ex) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 std::string("opencv: ") + ex.what(), kComponent);
  }

  const std::size_t cell_bins = static_cast<std::size_t>(opts_.h_bins) * opts_.s_bins * opts_.v_bins;
  const int grid = static_cast<int>(opts_.grid);
  std::vector<float> out(dimension(), 0.0f);
  std::vector<std::uint32_t> cell_pixels(static_cast<std::size_t>(grid) * grid, 0);

  for (int y = 0; y < side; ++y) {
    const auto* row = hsv.ptr<cv::Vec3b>(y);
    const int gy = std::min(y * grid / side, grid - 1);
    for (int x = 0; x < side; ++x) {
      const int gx = std::min(x * grid / side, grid - 1);
      const auto& px = row[x];
      const auto hb = std::min<std::uint32_t>(px[0] * opts_.h_bins / kHueRange, opts_.h_bins - 1);
      const auto sb = std::min<std::uint32_t>(px[1] * opts_.s_bins / kSatValRange, opts_.s_bins - 1);
      const auto vb = std::min<std::uint32_t>(px[2] * opts_.v_bins / kSatValRange, opts_.v_bins - 1);
      const std::size_t cell = static_cast<std::size_t>(gy) * grid + gx;
      const std::size_t bin = (hb * opts_.s_bins + sb) * opts_.v_bins + vb;
      out[cell * cell_bins + bin] += 1.0f;
      ++cell_pixels[cell];
    }
  }

  for (std::size_t cell = 0; cell < cell_pixels.size(); ++cell) {
    if (cell_pixels[cell] == 0) continue;
    const float inv = 1.0f / static_cast<float>(cell_pixels[cell]);
    for (std::size_t b = 0; b < cell_bins; ++b) {
      auto& v = out[cell * cell_bins + b];
      v = std::sqrt(v * inv);
    }
  }
  return out;
}

} // namespace iris::embed

#include "iris/image/decoded_image.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace iris::image {

auto decode_image(std::span<const std::uint8_t> encoded) -> std::expected<DecodedImage, core::error> {
  const std::string component = "image.decode";
  if (encoded.empty()) {
    return core::make_unexpected(core::error_code::invalid_image, "empty image data", component);
  }
  if (encoded.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return core::make_unexpected(core::error_code::invalid_image,
                                 "image data too large (" + std::to_string(encoded.size()) + " bytes)",
                                 component);
  }

  cv::Mat bgr;
  try {
    const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                      const_cast<std::uint8_t*>(encoded.data()));
    bgr = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    return core::make_unexpected(core::error_code::invalid_image,
                                 std::string("decoder rejected data: ") + ex.what(), component);
  }
  if (bgr.empty() || bgr.cols <= 0 || bgr.rows <= 0) {
    return core::make_unexpected(core::error_code::invalid_image,
                                 "unsupported, corrupt or truncated image data (" +
                                     std::to_string(encoded.size()) + " bytes)",
                                 component);
  }
  if (static_cast<std::uint32_t>(bgr.cols) > kMaxImageSide ||
      static_cast<std::uint32_t>(bgr.rows) > kMaxImageSide) {
    return core::make_unexpected(core::error_code::invalid_image,
                                 "image dimensions " + std::to_string(bgr.cols) + "x" +
                                     std::to_string(bgr.rows) + " exceed limit",
                                 component);
  }

  cv::Mat rgb;
  try {
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  } catch (const cv::Exception& ex) {
    return core::make_unexpected(core::error_code::invalid_image,
                                 std::string("color conversion failed: ") + ex.what(), component);
  }

  DecodedImage out;
  out.width = static_cast<std::uint32_t>(rgb.cols);
  out.height = static_cast<std::uint32_t>(rgb.rows);
  out.channels = 3;
  out.pixels.resize(static_cast<std::size_t>(out.width) * out.height * out.channels);
  const std::size_t row_bytes = static_cast<std::size_t>(out.width) * out.channels;
  for (int y = 0; y < rgb.rows; ++y) {
    const auto* src = rgb.ptr<std::uint8_t>(y);
    std::copy(src, src + row_bytes, out.pixels.begin() + static_cast<std::ptrdiff_t>(y * row_bytes));
  }
  return out;
}

} // namespace iris::image

#include "iris/embed/onnx_clip_encoder.hpp"

#include <algorithm>
#include <cstdint>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "iris/core/log.hpp"

namespace iris::embed {

namespace {
constexpr const char* kComponent = "embed.onnx";
} // namespace

OnnxClipEncoder::OnnxClipEncoder(OnnxClipOptions options)
    : opts_(std::move(options)), env_(ORT_LOGGING_LEVEL_WARNING, "iris") {}

auto OnnxClipEncoder::open(OnnxClipOptions options)
    -> std::expected<std::unique_ptr<OnnxClipEncoder>, core::error> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(options.model_path, ec)) {
    return core::make_unexpected(core::error_code::not_found,
                                 "onnx model not found: " + options.model_path.string(), kComponent);
  }
  if (options.input_side <= 0) {
    return core::make_unexpected(core::error_code::invalid_parameter, "input_side must be positive",
                                 kComponent);
  }

  std::unique_ptr<OnnxClipEncoder> enc(new OnnxClipEncoder(std::move(options)));
  try {
    enc->session_options_.SetIntraOpNumThreads(std::max(enc->opts_.intra_op_threads, 1));
    enc->session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
    enc->session_ = Ort::Session(enc->env_, enc->opts_.model_path.c_str(), enc->session_options_);

    Ort::AllocatorWithDefaultOptions alloc;
    if (enc->session_.GetInputCount() < 1 || enc->session_.GetOutputCount() < 1) {
      return core::make_unexpected(core::error_code::encoding_failure,
                                   "model has no input or no output", kComponent);
    }
    enc->input_name_ = enc->session_.GetInputNameAllocated(0, alloc).get();
    enc->output_name_ = enc->session_.GetOutputNameAllocated(0, alloc).get();

    auto shape = enc->session_.GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 2 || shape[1] <= 0) {
      return core::make_unexpected(core::error_code::encoding_failure,
                                   "expected output shape [1, D] from " + enc->output_name_,
                                   kComponent);
    }
    enc->dimension_ = static_cast<std::size_t>(shape[1]);
  } catch (const Ort::Exception& ex) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 std::string("onnxruntime: ") + ex.what(), kComponent);
  }

  enc->model_name_ = enc->opts_.model_name.empty()
                         ? "onnx-" + enc->opts_.model_path.stem().string()
                         : enc->opts_.model_name;
  core::logger()->info("[ONNX] loaded {} input={} output={} dim={}", enc->model_name_,
                       enc->input_name_, enc->output_name_, enc->dimension_);
  return enc;
}

auto OnnxClipEncoder::preprocess(const image::DecodedImage& img) const
    -> std::expected<std::vector<float>, core::error> {
  const int side = opts_.input_side;
  cv::Mat crop;
  try {
    cv::Mat rgb(static_cast<int>(img.height), static_cast<int>(img.width), CV_8UC3,
                const_cast<std::uint8_t*>(img.pixels.data()));
    const double scale = static_cast<double>(side) / std::min(img.width, img.height);
    const int w = std::max(side, static_cast<int>(img.width * scale + 0.5));
    const int h = std::max(side, static_cast<int>(img.height * scale + 0.5));
    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(w, h), 0, 0, cv::INTER_CUBIC);
    crop = resized(cv::Rect((w - side) / 2, (h - side) / 2, side, side));
  } catch (const cv::Exception& ex) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 std::string("opencv: ") + ex.what(), kComponent);
  }

  const std::size_t plane = static_cast<std::size_t>(side) * side;
  std::vector<float> chw(plane * 3);
  for (int y = 0; y < side; ++y) {
    const auto* row = crop.ptr<cv::Vec3b>(y);
    for (int x = 0; x < side; ++x) {
      const std::size_t at = static_cast<std::size_t>(y) * side + x;
      for (int c = 0; c < 3; ++c) {
        const float v = static_cast<float>(row[x][c]) / 255.0f;
        chw[c * plane + at] = (v - opts_.mean[c]) / opts_.stddev[c];
      }
    }
  }
  return chw;
}

auto OnnxClipEncoder::encode_raw(const image::DecodedImage& img)
    -> std::expected<std::vector<float>, core::error> {
  if (img.channels != 3) {
    return core::make_unexpected(core::error_code::encoding_failure, "expected RGB input",
                                 kComponent);
  }
  auto input = preprocess(img);
  if (!input) return std::unexpected(input.error());

  const std::array<std::int64_t, 4> shape{1, 3, opts_.input_side, opts_.input_side};
  try {
    auto mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value tensor = Ort::Value::CreateTensor<float>(mem, input->data(), input->size(),
                                                        shape.data(), shape.size());
    const char* in_names[] = {input_name_.c_str()};
    const char* out_names[] = {output_name_.c_str()};

    // Session::Run is safe to call concurrently on one session.
    auto outs = session_.Run(Ort::RunOptions{nullptr}, in_names, &tensor, 1, out_names, 1);
    if (outs.empty() || !outs[0].IsTensor()) {
      return core::make_unexpected(core::error_code::encoding_failure, "model returned no tensor",
                                   kComponent);
    }
    const auto count = outs[0].GetTensorTypeAndShapeInfo().GetElementCount();
    const float* data = outs[0].GetTensorData<float>();
    return std::vector<float>(data, data + count);
  } catch (const Ort::Exception& ex) {
    return core::make_unexpected(core::error_code::encoding_failure,
                                 std::string("onnxruntime: ") + ex.what(), kComponent);
  }
}

} // namespace iris::embed

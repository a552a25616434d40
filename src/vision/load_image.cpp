#include <vieweval/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <vieweval/core/frame.hpp>
#include <vieweval/core/logger.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace vieweval::vision {

std::optional<vieweval::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path);
  if (mat.empty()) return std::nullopt;

  vieweval::core::PixelFormat format = vieweval::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = vieweval::core::PixelFormat::Grayscale8;

  return detail::mat_to_frame(mat, format);
}

std::expected<void, vieweval::core::EvalError> save_frame_to_image(
    const vieweval::core::Frame& frame, const std::string& path) {
  using vieweval::core::EvalError;

  std::optional<cv::Mat> mat = frame.format() == vieweval::core::PixelFormat::Grayscale8
                                   ? detail::frame_to_mat(frame)
                                   : detail::frame_to_bgr(frame);
  if (!mat) return std::unexpected(EvalError::InvalidImage);

  try {
    if (!cv::imwrite(path, *mat)) return std::unexpected(EvalError::LoadFailed);
  } catch (const cv::Exception& e) {
    logger().warn("cannot write '{}': {}", path, e.what());
    return std::unexpected(EvalError::LoadFailed);
  }
  return {};
}

}  // namespace vieweval::vision

#include "frame_cv_utils.hpp"
#include <vieweval/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace vieweval::vision::detail {

namespace vc = vieweval::core;

std::optional<cv::Mat> frame_to_mat(const vc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.stride();
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case vc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case vc::PixelFormat::RGB8:
    case vc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case vc::PixelFormat::RGBA8:
    case vc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case vc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> frame_to_bgr(const vc::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat bgr;
  switch (frame.format()) {
    case vc::PixelFormat::BGR8:
      return mat;
    case vc::PixelFormat::Grayscale8:
      cv::cvtColor(*mat, bgr, cv::COLOR_GRAY2BGR);
      break;
    case vc::PixelFormat::RGB8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
      break;
    case vc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGBA2BGR);
      break;
    case vc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_BGRA2BGR);
      break;
    case vc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return bgr;
}

vc::Frame mat_to_frame(const cv::Mat& mat, vc::PixelFormat format) {
  if (mat.empty()) return vc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return vc::Frame(w, h, format, std::move(buffer));
}

}  // namespace vieweval::vision::detail

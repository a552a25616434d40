#include <vieweval/vision/layout_annotator.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace vieweval::vision {

namespace vc = vieweval::core;

namespace {

const cv::Scalar kRed(0, 0, 255);
constexpr int kBoxThickness = 2;
constexpr double kLabelScale = 0.5;

}  // namespace

std::expected<vc::Frame, vc::EvalError> annotate_layout(const vc::Frame& screenshot,
                                                       const vc::LayoutSnapshot& snapshot) {
  auto bgr = detail::frame_to_bgr(screenshot);
  if (!bgr) return std::unexpected(vc::EvalError::InvalidImage);

  cv::Mat canvas = bgr->clone();
  for (const auto& c : snapshot.components) {
    if (c.bbox.degenerate()) continue;
    const cv::Point top_left(static_cast<int>(std::lround(c.bbox.x)),
                             static_cast<int>(std::lround(c.bbox.y)));
    const cv::Point bottom_right(static_cast<int>(std::lround(c.bbox.right())),
                                 static_cast<int>(std::lround(c.bbox.bottom())));
    cv::rectangle(canvas, top_left, bottom_right, kRed, kBoxThickness);

    const std::string label(vc::to_string(c.category));
    const cv::Point origin(top_left.x, std::max(top_left.y - 5, 12));
    cv::putText(canvas, label, origin, cv::FONT_HERSHEY_SIMPLEX, kLabelScale, kRed, 1);
  }
  return detail::mat_to_frame(canvas, vc::PixelFormat::BGR8);
}

}  // namespace vieweval::vision

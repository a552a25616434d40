#include <vieweval/vision/pixel_diff.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <cmath>
#include <vector>

namespace vieweval::vision {

namespace vc = vieweval::core;

std::expected<vc::PixelDiffStats, vc::EvalError> compute_pixel_diff(const vc::Frame& actual,
                                                                   const vc::Frame& expected) {
  auto a = detail::frame_to_bgr(actual);
  auto b = detail::frame_to_bgr(expected);
  if (!a || !b) return std::unexpected(vc::EvalError::InvalidImage);
  if (!actual.same_size(expected)) {
    return std::unexpected(vc::EvalError::DimensionMismatchError);
  }

  vc::PixelDiffStats stats;
  stats.width = actual.width();
  stats.height = actual.height();

  const double pixels = static_cast<double>(a->total());
  const double samples = pixels * a->channels();
  stats.mse = cv::norm(*a, *b, cv::NORM_L2SQR) / samples;
  stats.rmse = std::sqrt(stats.mse);
  stats.percentage_difference = stats.rmse / 255.0 * 100.0;

  cv::Mat diff;
  cv::absdiff(*a, *b, diff);
  std::vector<cv::Mat> channels;
  cv::split(diff, channels);
  cv::Mat any = channels[0];
  for (std::size_t i = 1; i < channels.size(); ++i) any = cv::max(any, channels[i]);
  stats.differing_pixel_fraction = static_cast<double>(cv::countNonZero(any)) / pixels;
  return stats;
}

}  // namespace vieweval::vision

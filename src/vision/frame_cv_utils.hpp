#pragma once

#include <vieweval/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace vieweval::vision::detail {

/// View a Frame as a cv::Mat (no copy). Returns nullopt if the frame is invalid or the format unsupported.
std::optional<cv::Mat> frame_to_mat(const vieweval::core::Frame& frame);

/// 3-channel BGR rendition of a frame: grayscale expanded, alpha dropped, RGB reordered.
/// May share memory with the frame when it already is BGR8.
std::optional<cv::Mat> frame_to_bgr(const vieweval::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
vieweval::core::Frame mat_to_frame(const cv::Mat& mat,
                                   vieweval::core::PixelFormat format);

}  // namespace vieweval::vision::detail

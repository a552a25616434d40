#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/frame.hpp>
#include <vieweval/core/report.hpp>
#include <expected>

namespace vieweval::vision {

/// Mean squared error, RMSE and percentage difference (RMSE / 255 * 100) of two images
/// of identical size. Both are compared as 8-bit BGR, so a grayscale screenshot and its
/// BGR ground truth compare by content. No resizing: DimensionMismatchError when width or
/// height differ, InvalidImage for empty frames or unsupported formats.
[[nodiscard]] std::expected<vieweval::core::PixelDiffStats, vieweval::core::EvalError>
compute_pixel_diff(const vieweval::core::Frame& actual, const vieweval::core::Frame& expected);

}  // namespace vieweval::vision

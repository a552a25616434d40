#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/frame.hpp>
#include <expected>
#include <optional>
#include <string>

namespace vieweval::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<vieweval::core::Frame> load_frame_from_image(const std::string& path);

/// Write a frame to an image file; the encoder is chosen from the extension.
/// InvalidImage for an unusable frame, LoadFailed when encoding or writing fails.
[[nodiscard]] std::expected<void, vieweval::core::EvalError> save_frame_to_image(
    const vieweval::core::Frame& frame, const std::string& path);

}  // namespace vieweval::vision

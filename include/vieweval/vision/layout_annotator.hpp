#pragma once

#include <vieweval/core/component.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/frame.hpp>
#include <expected>

namespace vieweval::vision {

/// BGR8 copy of the screenshot with every component outlined in red and labelled
/// with its category. Boxes outside the image are clipped. InvalidImage for unusable frames.
[[nodiscard]] std::expected<vieweval::core::Frame, vieweval::core::EvalError> annotate_layout(
    const vieweval::core::Frame& screenshot, const vieweval::core::LayoutSnapshot& snapshot);

}  // namespace vieweval::vision

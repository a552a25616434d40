#pragma once

#include <vieweval/core/component.hpp>
#include <vieweval/core/frame.hpp>
#include <vieweval/core/rendered_viewport.hpp>
#include <optional>

namespace vieweval::core {

/// Inputs for evaluating one document at one breakpoint. Optional members
/// switch the corresponding comparison on.
struct ViewportInput {
  RenderedViewport rendered;
  std::optional<LayoutSnapshot> reference;  // ground-truth layout at the same viewport
  std::optional<Frame> screenshot;
  std::optional<Frame> ground_truth;
};

}  // namespace vieweval::core

#include <vieweval/core/rendered_viewport.hpp>

namespace vieweval::core {

bool ComputedStyle::visible() const noexcept {
  if (display == "none") return false;
  if (visibility == "hidden" || visibility == "collapse") return false;
  return opacity > 0.0;
}

std::size_t RenderedViewport::styled_count() const noexcept {
  std::size_t n = 0;
  for (const auto& [id, geometry] : elements) {
    if (geometry.style) ++n;
  }
  return n;
}

}  // namespace vieweval::core

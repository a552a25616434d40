#pragma once

#include <vieweval/core/geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace vieweval::core {

/// Named viewport width used to simulate a device class.
struct Breakpoint {
  std::string name;
  std::uint32_t width{0};
};

/// Computed style values the checks rely on, as reported by the renderer.
struct ComputedStyle {
  std::string display;
  std::string visibility;
  double opacity{1.0};
  double font_size_px{0.0};
  /// Computed line-height in pixels; nullopt when the renderer reported "normal".
  std::optional<double> line_height_px;

  /// False for display:none, visibility:hidden|collapse and fully transparent elements.
  [[nodiscard]] bool visible() const noexcept;

  /// Line height in pixels; "normal" becomes font_size_px * normal_factor.
  [[nodiscard]] double resolved_line_height(double normal_factor) const noexcept {
    return line_height_px.value_or(font_size_px * normal_factor);
  }
};

/// Rendered box and (when supplied) computed style of one element.
struct ElementGeometry {
  BBox bbox{};
  std::optional<ComputedStyle> style;

  /// Visible with a non-empty box. Elements without style count as visible.
  [[nodiscard]] bool rendered() const noexcept {
    return !bbox.degenerate() && (!style || style->visible());
  }
};

/// Render dump of one document at one breakpoint, keyed by element id.
/// Immutable once loaded; safe to share across threads.
struct RenderedViewport {
  Breakpoint breakpoint;
  double page_width{0.0};   // scroll width; 0 when unknown
  double page_height{0.0};
  std::unordered_map<std::string, ElementGeometry> elements;

  [[nodiscard]] const ElementGeometry* find(const std::string& element_id) const {
    const auto it = elements.find(element_id);
    return it == elements.end() ? nullptr : &it->second;
  }

  /// Number of elements that carry computed style.
  [[nodiscard]] std::size_t styled_count() const noexcept;
};

}  // namespace vieweval::core

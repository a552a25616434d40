#pragma once

namespace vieweval::core {

/// Axis-aligned bounding box in document pixel coordinates.
struct BBox {
  double x{0.0};
  double y{0.0};
  double w{0.0};
  double h{0.0};

  [[nodiscard]] double right() const noexcept { return x + w; }
  [[nodiscard]] double bottom() const noexcept { return y + h; }
  [[nodiscard]] double area() const noexcept {
    return (w > 0.0 && h > 0.0) ? w * h : 0.0;
  }
  [[nodiscard]] bool degenerate() const noexcept { return area() <= 0.0; }
};

/// Overlapping area of two boxes; 0 when disjoint.
[[nodiscard]] double intersection_area(const BBox& a, const BBox& b) noexcept;

/// Intersection over union. 0 when either box has zero area or the boxes are disjoint.
[[nodiscard]] double iou(const BBox& a, const BBox& b) noexcept;

/// True if inner lies entirely inside outer (edges may touch).
[[nodiscard]] bool contains(const BBox& outer, const BBox& inner) noexcept;

/// Two boxes are adjacent when they sit side by side on (roughly) the same row,
/// or stacked on (roughly) the same column, with at most adjacency_tolerance
/// pixels of gap. align_tolerance bounds the distance between their centres.
[[nodiscard]] bool boxes_adjacent(const BBox& a,
                                  const BBox& b,
                                  double align_tolerance = 8.0,
                                  double adjacency_tolerance = 4.0) noexcept;

/// Smallest box enclosing both.
[[nodiscard]] BBox merge(const BBox& a, const BBox& b) noexcept;

}  // namespace vieweval::core

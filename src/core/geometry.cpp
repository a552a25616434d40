#include <vieweval/core/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace vieweval::core {

double intersection_area(const BBox& a, const BBox& b) noexcept {
  const double left = std::max(a.x, b.x);
  const double top = std::max(a.y, b.y);
  const double right = std::min(a.right(), b.right());
  const double bottom = std::min(a.bottom(), b.bottom());
  const double iw = std::max(0.0, right - left);
  const double ih = std::max(0.0, bottom - top);
  return iw * ih;
}

double iou(const BBox& a, const BBox& b) noexcept {
  if (a.degenerate() || b.degenerate()) return 0.0;
  const double inter = intersection_area(a, b);
  if (inter <= 0.0) return 0.0;
  const double uni = a.area() + b.area() - inter;
  if (uni <= 0.0) return 0.0;
  return std::clamp(inter / uni, 0.0, 1.0);
}

bool contains(const BBox& outer, const BBox& inner) noexcept {
  return inner.x >= outer.x && inner.y >= outer.y &&
         inner.right() <= outer.right() && inner.bottom() <= outer.bottom();
}

bool boxes_adjacent(const BBox& a,
                    const BBox& b,
                    double align_tolerance,
                    double adjacency_tolerance) noexcept {
  const double a_cy = a.y + a.h / 2.0;
  const double b_cy = b.y + b.h / 2.0;
  const double a_cx = a.x + a.w / 2.0;
  const double b_cx = b.x + b.w / 2.0;

  const bool same_row = std::abs(a_cy - b_cy) <= align_tolerance;
  const bool side_by_side =
      (a.right() + adjacency_tolerance >= b.x && a.x < b.x) ||
      (b.right() + adjacency_tolerance >= a.x && b.x < a.x);

  const bool same_column = std::abs(a_cx - b_cx) <= align_tolerance;
  const bool stacked =
      (a.bottom() + adjacency_tolerance >= b.y && a.y < b.y) ||
      (b.bottom() + adjacency_tolerance >= a.y && b.y < a.y);

  return (same_row && side_by_side) || (same_column && stacked);
}

BBox merge(const BBox& a, const BBox& b) noexcept {
  const double left = std::min(a.x, b.x);
  const double top = std::min(a.y, b.y);
  const double right = std::max(a.right(), b.right());
  const double bottom = std::max(a.bottom(), b.bottom());
  return BBox{left, top, right - left, bottom - top};
}

}  // namespace vieweval::core

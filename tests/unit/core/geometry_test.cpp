#include <vieweval/core/geometry.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace vc = vieweval::core;

TEST(Geometry, AreaOfZeroSizedBoxIsZero) {
  EXPECT_DOUBLE_EQ((vc::BBox{0, 0, 10, 20}).area(), 200.0);
  EXPECT_DOUBLE_EQ((vc::BBox{5, 5, 0, 20}).area(), 0.0);
  EXPECT_TRUE((vc::BBox{5, 5, 10, 0}).degenerate());
  EXPECT_TRUE((vc::BBox{5, 5, -3, 10}).degenerate());
}

TEST(Geometry, IntersectionOfOverlappingBoxes) {
  const vc::BBox a{0, 0, 100, 100};
  const vc::BBox b{50, 50, 100, 100};
  EXPECT_DOUBLE_EQ(vc::intersection_area(a, b), 2500.0);
  EXPECT_NEAR(vc::iou(a, b), 2500.0 / 17500.0, 1e-12);
}

TEST(Geometry, IouIsSymmetric) {
  const std::vector<vc::BBox> boxes = {
      {0, 0, 100, 100}, {50, 50, 100, 100}, {10, 20, 30, 40},
      {200, 200, 5, 5}, {0, 0, 0, 10},      {-20, -5, 60, 30},
  };
  for (const auto& a : boxes) {
    for (const auto& b : boxes) {
      EXPECT_DOUBLE_EQ(vc::iou(a, b), vc::iou(b, a));
    }
  }
}

TEST(Geometry, IouBounds) {
  const vc::BBox a{10, 10, 40, 30};
  EXPECT_DOUBLE_EQ(vc::iou(a, a), 1.0);
  EXPECT_DOUBLE_EQ(vc::iou(a, vc::BBox{100, 100, 10, 10}), 0.0);
  EXPECT_DOUBLE_EQ(vc::iou(a, vc::BBox{10, 10, 0, 30}), 0.0);
  // Edge-touching boxes share no area.
  EXPECT_DOUBLE_EQ(vc::iou(a, vc::BBox{50, 10, 40, 30}), 0.0);
}

TEST(Geometry, Contains) {
  const vc::BBox outer{0, 0, 100, 50};
  EXPECT_TRUE(vc::contains(outer, vc::BBox{10, 10, 20, 20}));
  EXPECT_TRUE(vc::contains(outer, outer));
  EXPECT_FALSE(vc::contains(outer, vc::BBox{90, 10, 20, 20}));
}

TEST(Geometry, AdjacentSideBySideAndStacked) {
  // Same row, 3px gap.
  EXPECT_TRUE(vc::boxes_adjacent(vc::BBox{0, 0, 50, 20}, vc::BBox{53, 2, 40, 20}));
  // Same row, 10px gap.
  EXPECT_FALSE(vc::boxes_adjacent(vc::BBox{0, 0, 50, 20}, vc::BBox{60, 0, 40, 20}));
  // Same column, 4px gap.
  EXPECT_TRUE(vc::boxes_adjacent(vc::BBox{0, 0, 100, 20}, vc::BBox{0, 24, 100, 20}));
  // Rows whose centres are 30px apart.
  EXPECT_FALSE(vc::boxes_adjacent(vc::BBox{0, 0, 50, 20}, vc::BBox{52, 30, 50, 20}));
}

TEST(Geometry, MergeEnclosesBoth) {
  const auto m = vc::merge(vc::BBox{0, 0, 10, 10}, vc::BBox{20, 5, 10, 20});
  EXPECT_DOUBLE_EQ(m.x, 0.0);
  EXPECT_DOUBLE_EQ(m.y, 0.0);
  EXPECT_DOUBLE_EQ(m.w, 30.0);
  EXPECT_DOUBLE_EQ(m.h, 25.0);
}

#include <vieweval/core/component.hpp>
#include <vieweval/layout/layout_matcher.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <string>

namespace vc = vieweval::core;
namespace vl = vieweval::layout;
using vc::ComponentCategory;

namespace {

vc::VisualComponent comp(ComponentCategory c, vc::BBox box, const std::string& viewport = "mobile") {
  vc::VisualComponent v;
  v.category = c;
  v.bbox = box;
  v.source_viewport = viewport;
  return v;
}

vc::LayoutSnapshot snapshot(std::vector<vc::VisualComponent> components,
                            const std::string& viewport = "mobile") {
  vc::LayoutSnapshot s;
  s.viewport = viewport;
  s.components = std::move(components);
  return s;
}

}  // namespace

TEST(LayoutMatcher, PartialOverlapScenario) {
  const auto predicted = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100})});
  const auto reference = snapshot({comp(ComponentCategory::Image, {50, 50, 100, 100})});

  auto result = vl::LayoutMatcher().match(predicted, reference);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->score, 2500.0 / 17500.0, 1e-9);
  ASSERT_EQ(result->categories.size(), 1u);
  const auto* image = result->find(ComponentCategory::Image);
  ASSERT_NE(image, nullptr);
  EXPECT_NEAR(image->score, 0.142857, 1e-6);
  EXPECT_DOUBLE_EQ(image->weight, 1.0);
  ASSERT_EQ(image->matches.size(), 1u);
}

TEST(LayoutMatcher, IdenticalSnapshotsScoreOne) {
  const auto s = snapshot({
      comp(ComponentCategory::Image, {0, 0, 100, 100}),
      comp(ComponentCategory::Button, {10, 120, 80, 48}),
      comp(ComponentCategory::TextBlock, {0, 200, 300, 40}),
  });
  auto result = vl::LayoutMatcher().match(s, s);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->score, 1.0, 1e-12);
}

TEST(LayoutMatcher, BothEmptyScoresOne) {
  auto result = vl::LayoutMatcher().match(snapshot({}), snapshot({}));
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->score, 1.0);
  EXPECT_TRUE(result->categories.empty());
}

TEST(LayoutMatcher, OneSideEmptyScoresZero) {
  const auto s = snapshot({comp(ComponentCategory::Video, {0, 0, 100, 100}),
                           comp(ComponentCategory::Divider, {0, 120, 100, 2})});
  auto result = vl::LayoutMatcher().match(s, snapshot({}));
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->score, 0.0);
  EXPECT_EQ(result->categories.size(), 2u);
}

TEST(LayoutMatcher, DifferentViewportsAreIncompatible) {
  auto result = vl::LayoutMatcher().match(snapshot({}, "mobile"), snapshot({}, "desktop"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::EvalError::IncompatibleSnapshotError);
}

TEST(LayoutMatcher, ZeroAreaComponentsAreIgnored) {
  const auto predicted = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100}),
                                   comp(ComponentCategory::Image, {0, 0, 0, 50})});
  const auto reference = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100})});
  auto result = vl::LayoutMatcher().match(predicted, reference);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->score, 1.0);
  EXPECT_EQ(result->find(ComponentCategory::Image)->predicted_count, 1u);
}

TEST(LayoutMatcher, UnmatchedComponentsLowerTheScore) {
  const auto predicted = snapshot({comp(ComponentCategory::Button, {0, 0, 50, 50}),
                                   comp(ComponentCategory::Button, {100, 0, 50, 50})});
  const auto reference = snapshot({comp(ComponentCategory::Button, {0, 0, 50, 50})});
  auto result = vl::LayoutMatcher().match(predicted, reference);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->score, 0.5);
}

TEST(LayoutMatcher, CategoriesNeverMatchAcross) {
  const auto predicted = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100})});
  const auto reference = snapshot({comp(ComponentCategory::Video, {0, 0, 100, 100})});
  auto result = vl::LayoutMatcher().match(predicted, reference);
  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->score, 0.0);
}

TEST(LayoutMatcher, WeightsAreNormalizedOverPresentCategories) {
  vl::CategoryWeights weights;
  ASSERT_TRUE(weights.set(ComponentCategory::Image, 3.0).has_value());
  ASSERT_TRUE(weights.set(ComponentCategory::Button, 1.0).has_value());

  // Image matches perfectly, the button does not match at all.
  const auto predicted = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100}),
                                   comp(ComponentCategory::Button, {0, 200, 50, 50})});
  const auto reference = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100}),
                                   comp(ComponentCategory::Button, {300, 200, 50, 50})});
  auto result = vl::LayoutMatcher(weights).match(predicted, reference);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->score, 0.75, 1e-12);
  EXPECT_NEAR(result->find(ComponentCategory::Image)->weight, 0.75, 1e-12);
}

TEST(LayoutMatcher, ScalingAllWeightsLeavesScoreUnchanged) {
  vl::CategoryWeights weights;
  ASSERT_TRUE(weights.set(ComponentCategory::Image, 2.0).has_value());
  ASSERT_TRUE(weights.set(ComponentCategory::TextBlock, 0.5).has_value());
  const auto predicted = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100}),
                                   comp(ComponentCategory::TextBlock, {0, 120, 200, 30})});
  const auto reference = snapshot({comp(ComponentCategory::Image, {20, 10, 100, 100}),
                                   comp(ComponentCategory::TextBlock, {0, 130, 220, 30})});

  auto base = vl::LayoutMatcher(weights).match(predicted, reference);
  auto scaled = vl::LayoutMatcher(weights.scaled(7.5)).match(predicted, reference);
  ASSERT_TRUE(base.has_value());
  ASSERT_TRUE(scaled.has_value());
  EXPECT_NEAR(base->score, scaled->score, 1e-12);
}

TEST(LayoutMatcher, AllZeroWeightsFallBackToMean) {
  vl::CategoryWeights weights;
  for (const auto c : vc::kAllComponentCategories) {
    ASSERT_TRUE(weights.set(c, 0.0).has_value());
  }
  const auto predicted = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100}),
                                   comp(ComponentCategory::Button, {0, 200, 50, 50})});
  const auto reference = snapshot({comp(ComponentCategory::Image, {0, 0, 100, 100})});
  auto result = vl::LayoutMatcher(weights).match(predicted, reference);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->score, 0.5, 1e-12);
}

TEST(LayoutMatcher, ScoreIsBounded) {
  const auto predicted = snapshot({comp(ComponentCategory::TextBlock, {0, 0, 10, 10}),
                                   comp(ComponentCategory::TextBlock, {5, 5, 10, 10}),
                                   comp(ComponentCategory::TextBlock, {100, 100, 30, 30})});
  const auto reference = snapshot({comp(ComponentCategory::TextBlock, {2, 2, 10, 10}),
                                   comp(ComponentCategory::TextBlock, {90, 95, 30, 40})});
  auto result = vl::LayoutMatcher().match(predicted, reference);
  ASSERT_TRUE(result.has_value());
  EXPECT_GE(result->score, 0.0);
  EXPECT_LE(result->score, 1.0);
}

TEST(CategoryWeights, RejectsNegativeAndNonFinite) {
  vl::CategoryWeights weights;
  EXPECT_DOUBLE_EQ(weights.weight(ComponentCategory::Divider), 1.0);
  auto negative = weights.set(ComponentCategory::Divider, -1.0);
  ASSERT_FALSE(negative.has_value());
  EXPECT_EQ(negative.error(), vc::EvalError::InvalidConfig);
  EXPECT_FALSE(weights.set(ComponentCategory::Divider,
                           std::numeric_limits<double>::infinity()).has_value());
  EXPECT_DOUBLE_EQ(weights.weight(ComponentCategory::Divider), 1.0);
  EXPECT_TRUE(weights.valid());
}

TEST(GreedyMatch, PrefersHighestIouAndIsOneToOne) {
  const std::vector<vc::VisualComponent> predicted = {
      comp(ComponentCategory::Image, {0, 0, 100, 100}),
      comp(ComponentCategory::Image, {10, 0, 100, 100}),
  };
  const std::vector<vc::VisualComponent> reference = {
      comp(ComponentCategory::Image, {10, 0, 100, 100}),
  };
  const auto matches = vl::greedy_match(predicted, reference);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].predicted_index, 1u);
  EXPECT_EQ(matches[0].reference_index, 0u);
  EXPECT_DOUBLE_EQ(matches[0].iou, 1.0);
}

TEST(GreedyMatch, TiesGoToTheLowerPredictedIndex) {
  const std::vector<vc::VisualComponent> predicted = {
      comp(ComponentCategory::Button, {0, 0, 50, 50}),
      comp(ComponentCategory::Button, {0, 0, 50, 50}),
  };
  const std::vector<vc::VisualComponent> reference = {
      comp(ComponentCategory::Button, {0, 0, 50, 50}),
  };
  const auto matches = vl::greedy_match(predicted, reference);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].predicted_index, 0u);
}

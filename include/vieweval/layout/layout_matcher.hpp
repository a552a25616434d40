#pragma once

#include <vieweval/core/component.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/report.hpp>
#include <array>
#include <expected>
#include <span>
#include <vector>

namespace vieweval::layout {

/// One non-negative weight per category (default 1.0 each).
/// Weights are normalized over the categories present when scores are aggregated.
class CategoryWeights {
 public:
  CategoryWeights() { weights_.fill(1.0); }

  [[nodiscard]] double weight(core::ComponentCategory c) const noexcept {
    return weights_[core::index_of(c)];
  }

  /// Rejects negative and non-finite weights with InvalidConfig.
  [[nodiscard]] std::expected<void, core::EvalError> set(core::ComponentCategory c,
                                                         double weight);

  /// Multiplies every weight by factor (> 0).
  [[nodiscard]] CategoryWeights scaled(double factor) const;

  [[nodiscard]] bool valid() const noexcept;

 private:
  std::array<double, core::kComponentCategoryCount> weights_{};
};

/// Greedy one-to-one assignment maximizing IoU. Pairs with IoU > 0 are taken in order of
/// IoU (desc), combined area (desc), predicted index (asc), reference index (asc).
/// Returned indices refer to the given spans.
[[nodiscard]] std::vector<core::MatchedPair> greedy_match(
    std::span<const core::VisualComponent> predicted,
    std::span<const core::VisualComponent> reference);

/// Weighted IoU layout similarity between a predicted and a reference snapshot.
class LayoutMatcher {
 public:
  explicit LayoutMatcher(CategoryWeights weights = {});

  /// Fails with IncompatibleSnapshotError when the snapshots come from different viewports.
  /// Two empty snapshots score 1.0. Zero-area components take no part.
  [[nodiscard]] std::expected<core::LayoutSimilarity, core::EvalError> match(
      const core::LayoutSnapshot& predicted,
      const core::LayoutSnapshot& reference) const;

  [[nodiscard]] const CategoryWeights& weights() const noexcept { return weights_; }

 private:
  CategoryWeights weights_;
};

}  // namespace vieweval::layout

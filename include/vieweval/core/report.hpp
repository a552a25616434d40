#pragma once

#include <vieweval/core/component.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/rendered_viewport.hpp>
#include <vieweval/core/rule_result.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vieweval::core {

/// Pixel-level difference between a screenshot and its ground truth.
struct PixelDiffStats {
  double mse{0.0};
  double rmse{0.0};
  double percentage_difference{0.0};  // rmse / 255 * 100
  double differing_pixel_fraction{0.0};
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// One greedy assignment; indices refer to the snapshots' component vectors.
struct MatchedPair {
  std::size_t predicted_index{0};
  std::size_t reference_index{0};
  double iou{0.0};
};

struct CategoryScore {
  ComponentCategory category{ComponentCategory::TextBlock};
  double score{0.0};
  double weight{0.0};  // normalized over present categories
  std::size_t predicted_count{0};
  std::size_t reference_count{0};
  std::vector<MatchedPair> matches;
};

/// Layout Similarity Score plus its per-category breakdown.
struct LayoutSimilarity {
  double score{0.0};
  std::vector<CategoryScore> categories;

  [[nodiscard]] const CategoryScore* find(ComponentCategory c) const noexcept;
};

/// Stage that failed for a viewport; the other stages still ran.
struct StageFailure {
  std::string stage;
  EvalError error{EvalError::None};
};

/// Everything measured for one viewport.
struct ViewportReport {
  Breakpoint breakpoint;
  std::optional<LayoutSnapshot> snapshot;
  std::vector<std::string> diagnostics;
  std::vector<RuleResult> rules;
  std::optional<LayoutSimilarity> layout;
  std::optional<PixelDiffStats> pixel_diff;
  std::vector<StageFailure> failures;

  [[nodiscard]] bool passed() const noexcept;
};

/// Result of evaluating one document. Assembled once by the evaluator.
struct EvaluationReport {
  std::string document;
  std::vector<RuleResult> rules;  // document-level checks
  std::vector<ViewportReport> viewports;

  [[nodiscard]] bool passed() const noexcept;
};

}  // namespace vieweval::core

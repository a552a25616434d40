#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/pipeline_stage.hpp>
#include <vieweval/layout/layout_matcher.hpp>
#include <expected>
#include <optional>
#include <string_view>

namespace vieweval::layout {

/// Compares the extracted snapshot with the viewport's reference layout.
/// Does nothing when no reference was supplied. With min_score set, also adds a
/// layout_similarity rule (passes when LSS >= min_score).
class LayoutMatchStage : public vieweval::core::IEvaluationStage {
 public:
  explicit LayoutMatchStage(LayoutMatcher matcher,
                            std::optional<double> min_score = std::nullopt);

  [[nodiscard]] std::string_view name() const noexcept override { return "layout_match"; }

  /// ExtractionError when a reference exists but no snapshot was extracted;
  /// IncompatibleSnapshotError when the reference belongs to another viewport.
  [[nodiscard]] std::expected<void, vieweval::core::EvalError> process(
      const vieweval::core::ViewportInput& input,
      vieweval::core::ViewportReport& report) override;

 private:
  LayoutMatcher matcher_;
  std::optional<double> min_score_;
};

}  // namespace vieweval::layout

#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/pipeline_stage.hpp>
#include <expected>
#include <optional>
#include <string_view>

namespace vieweval::vision {

/// Compares the viewport's screenshot with its ground truth when both are supplied.
/// With max_percent set, also adds a pixel_difference rule.
class PixelDiffStage : public vieweval::core::IEvaluationStage {
 public:
  explicit PixelDiffStage(std::optional<double> max_percent = std::nullopt);

  [[nodiscard]] std::string_view name() const noexcept override { return "pixel_diff"; }

  [[nodiscard]] std::expected<void, vieweval::core::EvalError> process(
      const vieweval::core::ViewportInput& input,
      vieweval::core::ViewportReport& report) override;

 private:
  std::optional<double> max_percent_;
};

}  // namespace vieweval::vision

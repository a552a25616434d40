#pragma once

#include <vieweval/app/config.hpp>
#include <vieweval/core/component.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/rendered_viewport.hpp>
#include <vieweval/core/report.hpp>
#include <vieweval/core/viewport_input.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vieweval::app {

/// One document to evaluate: its HTML plus one input per breakpoint.
struct EvaluationRequest {
  std::string name;
  std::string html;
  std::vector<core::ViewportInput> viewports;
};

/// Runs document-level checks once and the per-viewport pipeline
/// (extraction, rule check, layout match, pixel diff) for every breakpoint.
/// Const after construction; evaluate() may be called concurrently.
class Evaluator {
 public:
  explicit Evaluator(EvaluationConfig config = default_config());

  /// InvalidConfig for unusable weights or thresholds; ExtractionError when the HTML
  /// cannot be parsed. Everything else is reported per viewport in the result.
  [[nodiscard]] std::expected<core::EvaluationReport, core::EvalError> evaluate(
      const EvaluationRequest& request) const;

  /// Snapshot of a reference document, for use as EvaluationRequest reference layout.
  [[nodiscard]] std::expected<core::LayoutSnapshot, core::EvalError> extract_layout(
      std::string_view html, const core::RenderedViewport& rendered) const;

  [[nodiscard]] const EvaluationConfig& config() const noexcept { return config_; }

 private:
  [[nodiscard]] std::expected<void, core::EvalError> validate() const;

  EvaluationConfig config_;
};

}  // namespace vieweval::app

#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/pipeline_stage.hpp>
#include <vieweval/dom/html_document.hpp>
#include <vieweval/rules/responsive_rule_checker.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace vieweval::rules {

/// Runs the per-viewport checks. Tap targets are checked only in the viewport
/// named strictest_viewport. The document must outlive the stage.
class RuleCheckStage : public vieweval::core::IEvaluationStage {
 public:
  RuleCheckStage(const dom::HtmlDocument& document,
                 ResponsiveRuleChecker checker,
                 std::string strictest_viewport);

  [[nodiscard]] std::string_view name() const noexcept override { return "rule_check"; }

  [[nodiscard]] std::expected<void, vieweval::core::EvalError> process(
      const vieweval::core::ViewportInput& input,
      vieweval::core::ViewportReport& report) override;

 private:
  const dom::HtmlDocument& document_;
  ResponsiveRuleChecker checker_;
  std::string strictest_viewport_;
};

}  // namespace vieweval::rules

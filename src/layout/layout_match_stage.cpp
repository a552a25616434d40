#include <vieweval/layout/layout_match_stage.hpp>
#include <vieweval/core/rule_result.hpp>
#include <string>
#include <utility>

namespace vieweval::layout {

namespace vc = vieweval::core;

LayoutMatchStage::LayoutMatchStage(LayoutMatcher matcher, std::optional<double> min_score)
    : matcher_(std::move(matcher)), min_score_(min_score) {}

std::expected<void, vc::EvalError> LayoutMatchStage::process(const vc::ViewportInput& input,
                                                             vc::ViewportReport& report) {
  if (!input.reference) return {};
  if (!report.snapshot) return std::unexpected(vc::EvalError::ExtractionError);

  auto similarity = matcher_.match(*report.snapshot, *input.reference);
  if (!similarity) return std::unexpected(similarity.error());

  if (min_score_) {
    vc::RuleResult rule;
    rule.rule_id = std::string(vc::rule_id::kLayoutSimilarity);
    rule.viewport = report.breakpoint.name;
    rule.measured_value = similarity->score;
    rule.threshold = *min_score_;
    rule.passed = similarity->score >= *min_score_;
    report.rules.push_back(std::move(rule));
  }
  report.layout = std::move(*similarity);
  return {};
}

}  // namespace vieweval::layout

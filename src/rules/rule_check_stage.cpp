#include <vieweval/rules/rule_check_stage.hpp>
#include <iterator>
#include <utility>

namespace vieweval::rules {

RuleCheckStage::RuleCheckStage(const dom::HtmlDocument& document,
                               ResponsiveRuleChecker checker,
                               std::string strictest_viewport)
    : document_(document),
      checker_(std::move(checker)),
      strictest_viewport_(std::move(strictest_viewport)) {}

std::expected<void, vieweval::core::EvalError> RuleCheckStage::process(
    const vieweval::core::ViewportInput& input,
    vieweval::core::ViewportReport& report) {
  const bool strictest = input.rendered.breakpoint.name == strictest_viewport_;
  auto style = checker_.check_viewport_style(document_, input.rendered);
  if (style) {
    report.rules.insert(report.rules.end(), std::make_move_iterator(style->begin()),
                        std::make_move_iterator(style->end()));
  }

  // Geometry checks hold even when the dump carries no computed style.
  auto geometry = checker_.check_viewport_geometry(document_, input.rendered, strictest);
  report.rules.insert(report.rules.end(), std::make_move_iterator(geometry.begin()),
                      std::make_move_iterator(geometry.end()));

  if (!style) return std::unexpected(style.error());
  return {};
}

}  // namespace vieweval::rules

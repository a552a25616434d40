#include <vieweval/vision/pixel_diff_stage.hpp>
#include <vieweval/core/logger.hpp>
#include <vieweval/core/rule_result.hpp>
#include <vieweval/vision/pixel_diff.hpp>
#include <string>

namespace vieweval::vision {

namespace vc = vieweval::core;

PixelDiffStage::PixelDiffStage(std::optional<double> max_percent)
    : max_percent_(max_percent) {}

std::expected<void, vc::EvalError> PixelDiffStage::process(const vc::ViewportInput& input,
                                                           vc::ViewportReport& report) {
  if (!input.screenshot || !input.ground_truth) {
    if (input.screenshot || input.ground_truth) {
      logger().debug("viewport '{}': pixel diff needs both screenshot and ground truth",
                     report.breakpoint.name);
    }
    return {};
  }

  auto stats = compute_pixel_diff(*input.screenshot, *input.ground_truth);
  if (!stats) return std::unexpected(stats.error());

  if (max_percent_) {
    vc::RuleResult rule;
    rule.rule_id = std::string(vc::rule_id::kPixelDifference);
    rule.viewport = report.breakpoint.name;
    rule.measured_value = stats->percentage_difference;
    rule.threshold = *max_percent_;
    rule.passed = stats->percentage_difference <= *max_percent_;
    report.rules.push_back(std::move(rule));
  }
  report.pixel_diff = *stats;
  return {};
}

}  // namespace vieweval::vision

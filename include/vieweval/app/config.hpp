#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/rendered_viewport.hpp>
#include <vieweval/layout/layout_matcher.hpp>
#include <vieweval/rules/responsive_rule_checker.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vieweval::app {

/// Evaluation configuration: breakpoints, category weights, rule thresholds.
struct EvaluationConfig {
  std::vector<core::Breakpoint> breakpoints;
  layout::CategoryWeights weights;
  rules::RuleThresholds thresholds;
  bool merge_text_blocks{true};
  std::optional<double> min_layout_similarity;         // adds the layout_similarity rule
  std::optional<double> max_pixel_difference_percent;  // adds the pixel_difference rule
  std::size_t num_workers{0};                          // 0 = hardware concurrency
  std::string log_level{"info"};

  [[nodiscard]] const core::Breakpoint* find_breakpoint(std::string_view name) const;
};

/// Default config when no file is provided (mobile=375, tablet=1024, desktop=1280).
EvaluationConfig default_config();

/// Parse key=value lines ('#' comments and blank lines ignored) on top of the defaults.
/// InvalidConfig for malformed numbers, unknown categories or negative weights.
/// Unknown keys are logged and ignored.
[[nodiscard]] std::expected<EvaluationConfig, core::EvalError> parse_config(std::string_view text);

/// Load config from a key=value file. LoadFailed when the file cannot be read.
[[nodiscard]] std::expected<EvaluationConfig, core::EvalError> load_config(const std::string& path);

}  // namespace vieweval::app

#include <vieweval/app/evaluator.hpp>
#include <vieweval/app/pipeline_runner.hpp>
#include <vieweval/core/logger.hpp>
#include <vieweval/core/pipeline.hpp>
#include <vieweval/dom/html_document.hpp>
#include <vieweval/layout/component_extractor.hpp>
#include <vieweval/layout/extraction_stage.hpp>
#include <vieweval/layout/layout_match_stage.hpp>
#include <vieweval/rules/responsive_rule_checker.hpp>
#include <vieweval/rules/rule_check_stage.hpp>
#include <vieweval/vision/pixel_diff_stage.hpp>
#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <utility>

namespace vieweval::app {

namespace {

layout::ComponentExtractor make_extractor(const EvaluationConfig& cfg) {
  layout::ExtractionOptions options;
  options.merge_text_blocks = cfg.merge_text_blocks;
  return layout::ComponentExtractor(layout::ElementClassifier::with_default_rules(), options);
}

/// Narrowest breakpoint among the viewports. Without widths, the narrowest configured
/// breakpoint that names one of the viewports; failing that, the first viewport.
core::Breakpoint strictest_breakpoint(const EvaluationConfig& cfg,
                                      const std::vector<core::ViewportInput>& viewports) {
  std::optional<core::Breakpoint> best;
  auto consider = [&best](const core::Breakpoint& b) {
    if (b.width == 0) return;
    if (!best || b.width < best->width) best = b;
  };
  for (const auto& v : viewports) consider(v.rendered.breakpoint);
  if (best || viewports.empty()) return best.value_or(core::Breakpoint{});

  for (const auto& v : viewports) {
    if (const auto* b = cfg.find_breakpoint(v.rendered.breakpoint.name)) consider(*b);
  }
  if (best) return *best;

  core::Breakpoint first = viewports.front().rendered.breakpoint;
  logger().warn("no viewport carries a width or a configured breakpoint name; "
                "checking tap targets at '{}'", first.name);
  return first;
}

bool positive(double v) { return std::isfinite(v) && v > 0.0; }

}  // namespace

Evaluator::Evaluator(EvaluationConfig config) : config_(std::move(config)) {}

std::expected<void, core::EvalError> Evaluator::validate() const {
  const auto& t = config_.thresholds;
  if (!config_.weights.valid() || !positive(t.min_font_size_px) ||
      !positive(t.min_tap_target_px) || !positive(t.min_line_height_ratio) ||
      !positive(t.normal_line_height_factor) || !positive(t.root_font_size_px) ||
      !std::isfinite(t.min_relative_unit_ratio) || t.min_relative_unit_ratio < 0.0 ||
      t.min_relative_unit_ratio > 1.0) {
    return std::unexpected(core::EvalError::InvalidConfig);
  }
  return {};
}

std::expected<core::EvaluationReport, core::EvalError> Evaluator::evaluate(
    const EvaluationRequest& request) const {
  if (auto ok = validate(); !ok) {
    logger().error("'{}': invalid evaluation config", request.name);
    return std::unexpected(ok.error());
  }

  auto document = dom::HtmlDocument::parse(request.html);
  if (!document) {
    logger().error("'{}': cannot parse HTML", request.name);
    return std::unexpected(document.error());
  }

  const auto start = std::chrono::steady_clock::now();
  const core::Breakpoint strictest = strictest_breakpoint(config_, request.viewports);
  const rules::ResponsiveRuleChecker checker(config_.thresholds);

  core::EvaluationReport report;
  report.document = request.name;
  report.rules = checker.check_document(*document, static_cast<double>(strictest.width));

  core::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<layout::ExtractionStage>(*document, make_extractor(config_)));
  pipeline.add_stage(std::make_unique<rules::RuleCheckStage>(*document, checker, strictest.name));
  pipeline.add_stage(std::make_unique<layout::LayoutMatchStage>(
      layout::LayoutMatcher(config_.weights), config_.min_layout_similarity));
  pipeline.add_stage(
      std::make_unique<vision::PixelDiffStage>(config_.max_pixel_difference_percent));

  // Each worker writes only its own slot; the join in run_viewports_parallel publishes them.
  std::vector<core::ViewportReport> viewports(request.viewports.size());
  run_viewports_parallel(
      pipeline, request.viewports,
      [&viewports](std::size_t index, core::ViewportReport r) { viewports[index] = std::move(r); },
      config_.num_workers);
  report.viewports = std::move(viewports);

  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  logger().info("'{}': {} viewports evaluated in {:.1f} ms, {}", request.name,
                report.viewports.size(), 1e-3 * static_cast<double>(elapsed.count()),
                report.passed() ? "passed" : "failed");
  return report;
}

std::expected<core::LayoutSnapshot, core::EvalError> Evaluator::extract_layout(
    std::string_view html, const core::RenderedViewport& rendered) const {
  auto document = dom::HtmlDocument::parse(html);
  if (!document) return std::unexpected(document.error());

  auto result = make_extractor(config_).extract(*document, rendered);
  if (!result) return std::unexpected(result.error());
  for (const auto& d : result->diagnostics) {
    logger().debug("reference '{}': {}", rendered.breakpoint.name, d);
  }
  return std::move(result->snapshot);
}

}  // namespace vieweval::app

#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/rendered_viewport.hpp>
#include <vieweval/core/rule_result.hpp>
#include <vieweval/dom/html_document.hpp>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vieweval::rules {

/// Thresholds of the responsive checks. A measurement equal to its threshold passes.
struct RuleThresholds {
  double min_font_size_px{12.0};
  double min_tap_target_px{48.0};
  double min_line_height_ratio{1.5};
  double normal_line_height_factor{1.2};  // line-height "normal" = font size * factor
  double min_relative_unit_ratio{0.5};    // relative / all sizing lengths
  double root_font_size_px{16.0};
};

/// Splits a viewport meta content ("width=device-width, initial-scale=1") into
/// lower-case keys and trimmed values. Both ',' and ';' separate entries.
[[nodiscard]] std::map<std::string, std::string> parse_meta_content(std::string_view content);

/// Stateless validator battery. Failing checks come back as RuleResult{passed=false};
/// the only error is ValidatorInputError for a render dump without any computed style.
class ResponsiveRuleChecker {
 public:
  explicit ResponsiveRuleChecker(RuleThresholds thresholds = {});

  // Document-level checks (run once per document).

  [[nodiscard]] core::RuleResult check_viewport_meta(const dom::HtmlDocument& document) const;
  [[nodiscard]] core::RuleResult check_responsive_media(const dom::HtmlDocument& document) const;
  [[nodiscard]] core::RuleResult check_relative_units(const dom::HtmlDocument& document) const;

  /// Inline font-size declarations resolved against the root font size; viewport units
  /// against narrowest_viewport_width.
  [[nodiscard]] core::RuleResult check_inline_font_sizes(const dom::HtmlDocument& document,
                                                         double narrowest_viewport_width) const;

  // Per-viewport checks over the render dump.

  [[nodiscard]] std::expected<core::RuleResult, core::EvalError> check_font_size(
      const dom::HtmlDocument& document, const core::RenderedViewport& rendered) const;
  [[nodiscard]] core::RuleResult check_tap_targets(const dom::HtmlDocument& document,
                                                   const core::RenderedViewport& rendered) const;
  [[nodiscard]] std::expected<core::RuleResult, core::EvalError> check_line_spacing(
      const dom::HtmlDocument& document, const core::RenderedViewport& rendered) const;

  /// nullopt when the render dump does not report the page width.
  [[nodiscard]] std::optional<core::RuleResult> check_horizontal_overflow(
      const core::RenderedViewport& rendered) const;

  /// All document-level checks in a fixed order.
  [[nodiscard]] std::vector<core::RuleResult> check_document(
      const dom::HtmlDocument& document, double narrowest_viewport_width) const;

  /// Per-viewport checks that need only rendered boxes: tap targets (when
  /// include_tap_targets is set) and horizontal overflow. Never fails.
  [[nodiscard]] std::vector<core::RuleResult> check_viewport_geometry(
      const dom::HtmlDocument& document,
      const core::RenderedViewport& rendered,
      bool include_tap_targets) const;

  /// Per-viewport checks over computed style: font size, then line spacing.
  /// ValidatorInputError when no element carries style.
  [[nodiscard]] std::expected<std::vector<core::RuleResult>, core::EvalError> check_viewport_style(
      const dom::HtmlDocument& document, const core::RenderedViewport& rendered) const;

  /// All per-viewport checks (style checks first); tap targets only when include_tap_targets
  /// is set (the strictest viewport). ValidatorInputError when no element carries style.
  [[nodiscard]] std::expected<std::vector<core::RuleResult>, core::EvalError> check_viewport(
      const dom::HtmlDocument& document,
      const core::RenderedViewport& rendered,
      bool include_tap_targets) const;

  [[nodiscard]] const RuleThresholds& thresholds() const noexcept { return thresholds_; }

 private:
  RuleThresholds thresholds_;
};

}  // namespace vieweval::rules

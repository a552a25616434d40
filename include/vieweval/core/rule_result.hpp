#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vieweval::core {

/// Numeric or categorical measurement.
using MeasuredValue = std::variant<double, std::string>;

/// Identifiers of the responsive checks.
namespace rule_id {
inline constexpr std::string_view kViewportMeta = "viewport_meta";
inline constexpr std::string_view kResponsiveMedia = "responsive_media";
inline constexpr std::string_view kRelativeUnits = "relative_units";
inline constexpr std::string_view kInlineFontSize = "inline_font_size";
inline constexpr std::string_view kFontSize = "font_size";
inline constexpr std::string_view kTapTarget = "tap_target";
inline constexpr std::string_view kLineSpacing = "line_spacing";
inline constexpr std::string_view kHorizontalOverflow = "horizontal_overflow";
inline constexpr std::string_view kLayoutSimilarity = "layout_similarity";
inline constexpr std::string_view kPixelDifference = "pixel_difference";
}  // namespace rule_id

/// Outcome of one check. A failing check is data, not an error.
/// affected_elements and details run in parallel: details[i] describes affected_elements[i].
struct RuleResult {
  std::string rule_id;
  std::string viewport;  // empty for document-level checks
  bool passed{false};
  MeasuredValue measured_value{0.0};
  MeasuredValue threshold{0.0};
  std::vector<std::string> affected_elements;
  std::vector<std::string> details;
};

}  // namespace vieweval::core

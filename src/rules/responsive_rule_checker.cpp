#include <vieweval/rules/responsive_rule_checker.hpp>
#include <vieweval/core/logger.hpp>
#include <vieweval/dom/css_length.hpp>
#include <vieweval/dom/css_parser.hpp>
#include <vieweval/layout/element_classifier.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <iterator>
#include <string>
#include <utility>

namespace vieweval::rules {

namespace {

namespace vc = vieweval::core;

constexpr double kEpsilon = 1e-9;
constexpr std::string_view kMetaViewportTarget = "meta[name=viewport]";

bool at_least(double value, double threshold) { return value + kEpsilon >= threshold; }

vc::RuleResult make_result(std::string_view id, const std::string& viewport) {
  vc::RuleResult r;
  r.rule_id = std::string(id);
  r.viewport = viewport;
  return r;
}

void flag(vc::RuleResult& r, std::string element, std::string detail) {
  r.affected_elements.push_back(std::move(element));
  r.details.push_back(std::move(detail));
}

bool is_text_bearing(const dom::Element& el) {
  return el.path != "body" && !el.text.empty();
}

std::optional<double> parse_number(std::string_view text) {
  const std::string t = dom::trim(text);
  if (t.empty()) return std::nullopt;
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
  if (ec != std::errc() || ptr != t.data() + t.size()) return std::nullopt;
  return value;
}

std::vector<dom::StyleRule> document_rules(const dom::HtmlDocument& document) {
  std::vector<dom::StyleRule> out;
  for (const auto& sheet : document.style_sheets()) {
    auto rules = dom::parse_stylesheet(sheet);
    out.insert(out.end(), std::make_move_iterator(rules.begin()),
               std::make_move_iterator(rules.end()));
  }
  return out;
}

bool rule_applies(const dom::StyleRule& rule, const dom::Element& el) {
  return std::any_of(rule.selectors.begin(), rule.selectors.end(),
                     [&el](const std::string& s) { return dom::selector_matches(s, el); });
}

std::string join_selectors(const std::vector<std::string>& selectors) {
  std::string out;
  for (const auto& s : selectors) {
    if (!out.empty()) out += ", ";
    out += s;
  }
  return out;
}

// --- responsive media ---

enum class Sizing { Unset, Relative, Absolute, Other };

/// Declared value plus whether it came from an HTML attribute (unitless means px there).
struct DeclaredSize {
  std::string value;
  bool from_attribute{false};
};

Sizing classify(const DeclaredSize& size) {
  const std::string v = dom::to_lower(dom::trim(size.value));
  if (v.empty()) return Sizing::Unset;
  if (size.from_attribute) {
    const auto len = dom::parse_length(v);
    if (!len) return Sizing::Other;
    if (len->unit == dom::LengthUnit::None || dom::is_absolute(len->unit)) {
      return Sizing::Absolute;
    }
    return Sizing::Relative;
  }
  bool absolute = false;
  for (const auto& len : dom::lengths_in(v)) {
    if (dom::is_relative(len.unit)) return Sizing::Relative;
    if (dom::is_absolute(len.unit)) absolute = true;
  }
  return absolute ? Sizing::Absolute : Sizing::Other;
}

struct MediaSizing {
  DeclaredSize width;
  DeclaredSize max_width;
  DeclaredSize height;

  void apply(const std::vector<dom::Declaration>& declarations) {
    for (const auto& d : declarations) {
      if (d.property == "width") width = {d.value, false};
      else if (d.property == "max-width") max_width = {d.value, false};
      else if (d.property == "height") height = {d.value, false};
    }
  }
};

std::string_view shown(const DeclaredSize& s) {
  return s.value.empty() ? std::string_view("unset") : std::string_view(s.value);
}

// --- relative units ---

constexpr std::array<std::string_view, 17> kSizingProperties = {
    "width",      "height",     "min-width",  "max-width", "min-height", "max-height",
    "margin",     "padding",    "gap",        "row-gap",   "column-gap", "flex-basis",
    "top",        "right",      "bottom",     "left",      "inset",
};

/// Box sizing declarations; font-size is left to the inline font-size check.
bool is_sizing_property(std::string_view property) {
  if (std::find(kSizingProperties.begin(), kSizingProperties.end(), property) !=
      kSizingProperties.end()) {
    return true;
  }
  return property.starts_with("margin-") || property.starts_with("padding-");
}

struct UnitTally {
  std::size_t relative{0};
  std::size_t absolute{0};
};

void tally_declarations(const std::vector<dom::Declaration>& declarations,
                        const std::string& source,
                        UnitTally& tally,
                        vc::RuleResult& r) {
  for (const auto& d : declarations) {
    if (!is_sizing_property(d.property)) continue;
    std::size_t absolute_here = 0;
    for (const auto& len : dom::lengths_in(d.value)) {
      if (dom::is_relative(len.unit)) ++tally.relative;
      else if (dom::is_absolute(len.unit)) ++absolute_here;
    }
    tally.absolute += absolute_here;
    if (absolute_here > 0) flag(r, source, fmt::format("{}: {}", d.property, d.value));
  }
}

// --- inline font size ---

std::optional<double> keyword_font_size(std::string_view value) {
  static constexpr std::pair<std::string_view, double> kKeywords[] = {
      {"xx-small", 9.0}, {"x-small", 10.0}, {"small", 13.0},  {"medium", 16.0},
      {"large", 18.0},   {"x-large", 24.0}, {"xx-large", 32.0}, {"xxx-large", 48.0},
  };
  for (const auto& [name, px] : kKeywords) {
    if (name == value) return px;
  }
  return std::nullopt;
}

}  // namespace

std::map<std::string, std::string> parse_meta_content(std::string_view content) {
  std::map<std::string, std::string> out;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= content.size(); ++i) {
    if (i < content.size() && content[i] != ',' && content[i] != ';') continue;
    const std::string_view entry = content.substr(start, i - start);
    start = i + 1;
    const auto eq = entry.find('=');
    if (eq == std::string_view::npos) {
      const std::string key = dom::to_lower(dom::trim(entry));
      if (!key.empty()) out[key] = "";
      continue;
    }
    const std::string key = dom::to_lower(dom::trim(entry.substr(0, eq)));
    if (key.empty()) continue;
    out[key] = dom::trim(entry.substr(eq + 1));
  }
  return out;
}

ResponsiveRuleChecker::ResponsiveRuleChecker(RuleThresholds thresholds)
    : thresholds_(thresholds) {}

vc::RuleResult ResponsiveRuleChecker::check_viewport_meta(
    const dom::HtmlDocument& document) const {
  auto r = make_result(vc::rule_id::kViewportMeta, "");
  r.threshold = std::string("width=device-width, initial-scale=1");

  const auto& content = document.meta_viewport();
  if (!content) {
    r.measured_value = std::string("missing");
    flag(r, std::string(kMetaViewportTarget), "no viewport meta tag");
    return r;
  }
  r.measured_value = *content;

  const auto entries = parse_meta_content(*content);
  const auto width = entries.find("width");
  const bool device_width =
      width != entries.end() && dom::to_lower(width->second) == "device-width";
  const auto scale = entries.find("initial-scale");
  std::optional<double> scale_value;
  if (scale != entries.end()) scale_value = parse_number(scale->second);
  const bool unit_scale = scale_value && std::abs(*scale_value - 1.0) < kEpsilon;

  r.passed = device_width && unit_scale;
  if (!r.passed) {
    std::string why;
    if (!device_width) why = "width is not device-width";
    if (!unit_scale) why += why.empty() ? "initial-scale is not 1" : ", initial-scale is not 1";
    flag(r, std::string(kMetaViewportTarget), fmt::format("content=\"{}\": {}", *content, why));
  }
  return r;
}

vc::RuleResult ResponsiveRuleChecker::check_responsive_media(
    const dom::HtmlDocument& document) const {
  auto r = make_result(vc::rule_id::kResponsiveMedia, "");
  r.threshold = 0.0;
  const auto rules = document_rules(document);

  for (const auto& el : document.elements()) {
    if (el.tag != "img" && el.tag != "video") continue;

    MediaSizing sizing;
    if (const auto* w = el.attribute("width")) sizing.width = {*w, true};
    if (const auto* h = el.attribute("height")) sizing.height = {*h, true};
    for (const auto& rule : rules) {
      if (rule_applies(rule, el)) sizing.apply(rule.declarations);
    }
    if (const auto* style = el.attribute("style")) {
      sizing.apply(dom::parse_declarations(*style));
    }

    const bool relative_width = classify(sizing.width) == Sizing::Relative ||
                                classify(sizing.max_width) == Sizing::Relative;
    const bool absolute_height = classify(sizing.height) == Sizing::Absolute;
    if (!relative_width || absolute_height) {
      flag(r, el.path,
           fmt::format("width={}, max-width={}, height={}", shown(sizing.width),
                       shown(sizing.max_width), shown(sizing.height)));
    }
  }

  r.measured_value = static_cast<double>(r.affected_elements.size());
  r.passed = r.affected_elements.empty();
  return r;
}

vc::RuleResult ResponsiveRuleChecker::check_relative_units(
    const dom::HtmlDocument& document) const {
  auto r = make_result(vc::rule_id::kRelativeUnits, "");
  r.threshold = thresholds_.min_relative_unit_ratio;

  UnitTally tally;
  for (const auto& rule : document_rules(document)) {
    tally_declarations(rule.declarations, join_selectors(rule.selectors), tally, r);
  }
  for (const auto& el : document.elements()) {
    if (const auto* style = el.attribute("style")) {
      tally_declarations(dom::parse_declarations(*style), el.path, tally, r);
    }
  }

  const std::size_t total = tally.relative + tally.absolute;
  const double ratio =
      total == 0 ? 1.0 : static_cast<double>(tally.relative) / static_cast<double>(total);
  r.measured_value = ratio;
  r.passed = at_least(ratio, thresholds_.min_relative_unit_ratio);
  logger().debug("relative units: {} relative, {} absolute", tally.relative, tally.absolute);
  return r;
}

vc::RuleResult ResponsiveRuleChecker::check_inline_font_sizes(
    const dom::HtmlDocument& document, double narrowest_viewport_width) const {
  auto r = make_result(vc::rule_id::kInlineFontSize, "");
  r.threshold = thresholds_.min_font_size_px;

  dom::ResolveContext context;
  context.font_size_px = thresholds_.root_font_size_px;
  context.root_font_px = thresholds_.root_font_size_px;
  context.viewport_width = narrowest_viewport_width;

  std::optional<double> smallest;
  for (const auto& el : document.elements()) {
    const auto* style = el.attribute("style");
    if (!style) continue;
    const auto value = dom::find_declaration(dom::parse_declarations(*style), "font-size");
    if (!value) continue;

    const std::string v = dom::to_lower(*value);
    std::optional<double> px = keyword_font_size(v);
    if (!px) {
      if (const auto len = dom::parse_length(v)) px = dom::to_px(*len, context);
    }
    if (!px) {
      logger().debug("{}: cannot resolve inline font-size '{}'", el.path, *value);
      continue;
    }

    smallest = smallest ? std::min(*smallest, *px) : *px;
    if (!at_least(*px, thresholds_.min_font_size_px)) {
      flag(r, el.path, fmt::format("font-size: {} ({:.1f}px)", *value, *px));
    }
  }

  if (smallest) r.measured_value = *smallest;
  else r.measured_value = std::string("no inline font sizes");
  r.passed = r.affected_elements.empty();
  return r;
}

std::expected<vc::RuleResult, vc::EvalError> ResponsiveRuleChecker::check_font_size(
    const dom::HtmlDocument& document, const vc::RenderedViewport& rendered) const {
  if (rendered.styled_count() == 0) {
    return std::unexpected(vc::EvalError::ValidatorInputError);
  }
  auto r = make_result(vc::rule_id::kFontSize, rendered.breakpoint.name);
  r.threshold = thresholds_.min_font_size_px;

  std::optional<double> smallest;
  for (const auto& el : document.elements()) {
    if (!is_text_bearing(el)) continue;
    const auto* geometry = rendered.find(el.path);
    if (!geometry || !geometry->style || !geometry->rendered()) continue;

    const double size = geometry->style->font_size_px;
    smallest = smallest ? std::min(*smallest, size) : size;
    if (!at_least(size, thresholds_.min_font_size_px)) {
      flag(r, el.path, fmt::format("{:.2f}px", size));
    }
  }

  if (smallest) r.measured_value = *smallest;
  else r.measured_value = std::string("no visible text");
  r.passed = r.affected_elements.empty();
  return r;
}

vc::RuleResult ResponsiveRuleChecker::check_tap_targets(
    const dom::HtmlDocument& document, const vc::RenderedViewport& rendered) const {
  auto r = make_result(vc::rule_id::kTapTarget, rendered.breakpoint.name);
  r.threshold = thresholds_.min_tap_target_px;

  std::optional<double> smallest;
  for (const auto& el : document.elements()) {
    if (!layout::is_interactive(el)) continue;
    const auto* geometry = rendered.find(el.path);
    if (!geometry || !geometry->rendered()) continue;

    const double w = geometry->bbox.w;
    const double h = geometry->bbox.h;
    const double side = std::min(w, h);
    smallest = smallest ? std::min(*smallest, side) : side;
    if (!at_least(w, thresholds_.min_tap_target_px) ||
        !at_least(h, thresholds_.min_tap_target_px)) {
      flag(r, el.path, fmt::format("{:g}x{:g}px", w, h));
    }
  }

  if (smallest) r.measured_value = *smallest;
  else r.measured_value = std::string("no interactive elements");
  r.passed = r.affected_elements.empty();
  return r;
}

std::expected<vc::RuleResult, vc::EvalError> ResponsiveRuleChecker::check_line_spacing(
    const dom::HtmlDocument& document, const vc::RenderedViewport& rendered) const {
  if (rendered.styled_count() == 0) {
    return std::unexpected(vc::EvalError::ValidatorInputError);
  }
  auto r = make_result(vc::rule_id::kLineSpacing, rendered.breakpoint.name);
  r.threshold = thresholds_.min_line_height_ratio;

  std::optional<double> smallest;
  for (const auto& el : document.elements()) {
    if (!is_text_bearing(el)) continue;
    const auto* geometry = rendered.find(el.path);
    if (!geometry || !geometry->style || !geometry->rendered()) continue;
    const auto& style = *geometry->style;
    if (style.font_size_px <= 0.0) continue;

    const double line_height = style.resolved_line_height(thresholds_.normal_line_height_factor);
    const double ratio = line_height / style.font_size_px;
    smallest = smallest ? std::min(*smallest, ratio) : ratio;
    if (!at_least(ratio, thresholds_.min_line_height_ratio)) {
      flag(r, el.path,
           fmt::format("{:.2f} ({:.1f}px / {:.1f}px{})", ratio, line_height, style.font_size_px,
                       style.line_height_px ? "" : ", normal"));
    }
  }

  if (smallest) r.measured_value = *smallest;
  else r.measured_value = std::string("no visible text");
  r.passed = r.affected_elements.empty();
  return r;
}

std::optional<vc::RuleResult> ResponsiveRuleChecker::check_horizontal_overflow(
    const vc::RenderedViewport& rendered) const {
  if (rendered.page_width <= 0.0 || rendered.breakpoint.width == 0) return std::nullopt;

  auto r = make_result(vc::rule_id::kHorizontalOverflow, rendered.breakpoint.name);
  const double width = static_cast<double>(rendered.breakpoint.width);
  r.threshold = width;
  r.measured_value = rendered.page_width;
  r.passed = rendered.page_width <= width + kEpsilon;
  if (!r.passed) {
    flag(r, "body", fmt::format("page is {:g}px wide in a {:g}px viewport", rendered.page_width,
                                width));
  }
  return r;
}

std::vector<vc::RuleResult> ResponsiveRuleChecker::check_document(
    const dom::HtmlDocument& document, double narrowest_viewport_width) const {
  std::vector<vc::RuleResult> out;
  out.push_back(check_viewport_meta(document));
  out.push_back(check_responsive_media(document));
  out.push_back(check_relative_units(document));
  out.push_back(check_inline_font_sizes(document, narrowest_viewport_width));
  return out;
}

std::vector<vc::RuleResult> ResponsiveRuleChecker::check_viewport_geometry(
    const dom::HtmlDocument& document,
    const vc::RenderedViewport& rendered,
    bool include_tap_targets) const {
  std::vector<vc::RuleResult> out;
  if (include_tap_targets) out.push_back(check_tap_targets(document, rendered));
  if (auto overflow = check_horizontal_overflow(rendered)) out.push_back(std::move(*overflow));
  return out;
}

std::expected<std::vector<vc::RuleResult>, vc::EvalError>
ResponsiveRuleChecker::check_viewport_style(const dom::HtmlDocument& document,
                                            const vc::RenderedViewport& rendered) const {
  auto font = check_font_size(document, rendered);
  if (!font) return std::unexpected(font.error());
  auto spacing = check_line_spacing(document, rendered);
  if (!spacing) return std::unexpected(spacing.error());

  std::vector<vc::RuleResult> out;
  out.push_back(std::move(*font));
  out.push_back(std::move(*spacing));
  return out;
}

std::expected<std::vector<vc::RuleResult>, vc::EvalError> ResponsiveRuleChecker::check_viewport(
    const dom::HtmlDocument& document,
    const vc::RenderedViewport& rendered,
    bool include_tap_targets) const {
  auto out = check_viewport_style(document, rendered);
  if (!out) return std::unexpected(out.error());
  auto geometry = check_viewport_geometry(document, rendered, include_tap_targets);
  out->insert(out->end(), std::make_move_iterator(geometry.begin()),
              std::make_move_iterator(geometry.end()));
  return out;
}

}  // namespace vieweval::rules

#include <vieweval/app/json_io.hpp>
#include <vieweval/core/logger.hpp>
#include <vieweval/dom/css_length.hpp>
#include <vieweval/dom/html_document.hpp>
#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace vieweval::app {

namespace {

using json = nlohmann::json;
namespace vc = vieweval::core;

/// Pixel value of a number or a CSS length string ("16px", "12pt").
std::optional<double> pixels_of(const json& value) {
  if (value.is_number()) return value.get<double>();
  if (!value.is_string()) return std::nullopt;
  const auto length = dom::parse_length(value.get<std::string>());
  if (!length) return std::nullopt;
  if (length->unit == dom::LengthUnit::None) return length->value;
  return dom::to_px(*length, dom::ResolveContext{});
}

std::optional<vc::BBox> parse_box(const json& box) {
  if (!box.is_object()) return std::nullopt;
  for (const char* key : {"x", "y", "width", "height"}) {
    if (!box.contains(key) || !box[key].is_number()) return std::nullopt;
  }
  return vc::BBox{box["x"].get<double>(), box["y"].get<double>(), box["width"].get<double>(),
                  box["height"].get<double>()};
}

/// nullopt when the entry carries no usable font size; the style then counts as absent.
std::optional<vc::ComputedStyle> parse_style(const json& style) {
  if (!style.is_object() || !style.contains("font_size")) return std::nullopt;
  const auto font_size = pixels_of(style["font_size"]);
  if (!font_size) return std::nullopt;

  vc::ComputedStyle out;
  out.font_size_px = *font_size;
  out.display = style.value("display", std::string("block"));
  out.visibility = style.value("visibility", std::string("visible"));
  if (style.contains("opacity")) {
    const auto& opacity = style["opacity"];
    if (opacity.is_number()) out.opacity = opacity.get<double>();
    else if (opacity.is_string()) out.opacity = std::stod(opacity.get<std::string>());
  }
  if (style.contains("line_height")) {
    const auto& lh = style["line_height"];
    const bool normal = lh.is_null() || (lh.is_string() && lh.get<std::string>() == "normal");
    if (!normal) {
      if (lh.is_string()) {
        // Unitless and relative line heights scale with the element's font size.
        const auto length = dom::parse_length(lh.get<std::string>());
        if (length) {
          dom::ResolveContext context;
          context.font_size_px = out.font_size_px;
          out.line_height_px = dom::to_px(*length, context);
        }
      } else {
        out.line_height_px = pixels_of(lh);
      }
    }
  }
  return out;
}

std::optional<json> parse_document(std::string_view text) {
  json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded()) return std::nullopt;
  return j;
}

json to_json(const vc::MeasuredValue& value) {
  return std::visit([](const auto& v) { return json(v); }, value);
}

json to_json(const vc::BBox& box) {
  return json{{"x", box.x}, {"y", box.y}, {"width", box.w}, {"height", box.h}};
}

}  // namespace

std::expected<std::string, vc::EvalError> read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    logger().error("cannot open '{}'", path);
    return std::unexpected(vc::EvalError::LoadFailed);
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

std::expected<vc::RenderedViewport, vc::EvalError> parse_rendered_viewport(
    std::string_view json_text, const std::vector<vc::Breakpoint>& known_breakpoints) {
  const auto j = parse_document(json_text);
  if (!j || !j->is_object()) return std::unexpected(vc::EvalError::LoadFailed);

  try {
    vc::RenderedViewport out;
    out.breakpoint.name = j->value("viewport", std::string());
    if (out.breakpoint.name.empty()) return std::unexpected(vc::EvalError::ExtractionError);

    if (j->contains("width")) {
      out.breakpoint.width = (*j)["width"].get<std::uint32_t>();
    } else {
      const auto it = std::find_if(known_breakpoints.begin(), known_breakpoints.end(),
                                   [&out](const vc::Breakpoint& b) {
                                     return b.name == out.breakpoint.name;
                                   });
      if (it != known_breakpoints.end()) out.breakpoint.width = it->width;
    }
    out.page_width = j->value("page_width", 0.0);
    out.page_height = j->value("page_height", 0.0);

    for (const auto& entry : j->value("elements", json::array())) {
      const std::string id = entry.value("id", std::string());
      const auto box = entry.contains("box") ? parse_box(entry["box"]) : std::nullopt;
      if (id.empty() || !box) {
        logger().error("render dump '{}': element without id or box", out.breakpoint.name);
        return std::unexpected(vc::EvalError::ExtractionError);
      }
      vc::ElementGeometry geometry;
      geometry.bbox = *box;
      if (entry.contains("style")) geometry.style = parse_style(entry["style"]);
      out.elements.insert_or_assign(id, std::move(geometry));
    }
    return out;
  } catch (const json::exception& e) {
    logger().error("render dump: {}", e.what());
    return std::unexpected(vc::EvalError::LoadFailed);
  } catch (const std::logic_error& e) {
    logger().error("render dump: bad number ({})", e.what());
    return std::unexpected(vc::EvalError::LoadFailed);
  }
}

std::expected<vc::RenderedViewport, vc::EvalError> load_rendered_viewport(
    const std::string& path, const std::vector<vc::Breakpoint>& known_breakpoints) {
  auto text = read_text_file(path);
  if (!text) return std::unexpected(text.error());
  return parse_rendered_viewport(*text, known_breakpoints);
}

std::expected<vc::LayoutSnapshot, vc::EvalError> parse_layout_snapshot(
    std::string_view json_text) {
  const auto j = parse_document(json_text);
  if (!j || !j->is_object()) return std::unexpected(vc::EvalError::LoadFailed);

  try {
    vc::LayoutSnapshot out;
    out.viewport = j->value("viewport", std::string());
    if (out.viewport.empty()) return std::unexpected(vc::EvalError::ExtractionError);

    for (const auto& entry : j->value("components", json::array())) {
      const std::string name = entry.value("category", std::string());
      const auto category = vc::parse_category(name);
      const auto box = entry.contains("box") ? parse_box(entry["box"]) : std::nullopt;
      if (!category || !box) {
        logger().error("snapshot '{}': bad component (category '{}')", out.viewport, name);
        return std::unexpected(vc::EvalError::ExtractionError);
      }
      vc::VisualComponent c;
      c.category = *category;
      c.bbox = *box;
      c.source_viewport = out.viewport;
      c.element_id = entry.value("element", std::string());
      c.text = entry.value("text", std::string());
      out.components.push_back(std::move(c));
    }
    return out;
  } catch (const json::exception& e) {
    logger().error("snapshot: {}", e.what());
    return std::unexpected(vc::EvalError::LoadFailed);
  }
}

std::expected<vc::LayoutSnapshot, vc::EvalError> load_layout_snapshot(const std::string& path) {
  auto text = read_text_file(path);
  if (!text) return std::unexpected(text.error());
  return parse_layout_snapshot(*text);
}

json to_json(const vc::LayoutSnapshot& snapshot) {
  json components = json::array();
  for (const auto& c : snapshot.components) {
    json entry{{"category", std::string(vc::to_string(c.category))}, {"box", to_json(c.bbox)}};
    if (!c.element_id.empty()) entry["element"] = c.element_id;
    if (!c.text.empty()) entry["text"] = c.text;
    components.push_back(std::move(entry));
  }
  return json{{"viewport", snapshot.viewport}, {"components", std::move(components)}};
}

json to_json(const vc::RuleResult& rule) {
  json out{{"rule_id", rule.rule_id},
           {"passed", rule.passed},
           {"measured_value", to_json(rule.measured_value)},
           {"threshold", to_json(rule.threshold)},
           {"affected_elements", rule.affected_elements},
           {"details", rule.details}};
  if (!rule.viewport.empty()) out["viewport"] = rule.viewport;
  return out;
}

json to_json(const vc::ViewportReport& report) {
  json rules = json::array();
  for (const auto& r : report.rules) rules.push_back(to_json(r));

  json failures = json::array();
  for (const auto& f : report.failures) {
    failures.push_back({{"stage", f.stage}, {"error", std::string(vc::to_string(f.error))}});
  }

  json out{{"viewport", report.breakpoint.name},
           {"width", report.breakpoint.width},
           {"passed", report.passed()},
           {"diagnostics", report.diagnostics},
           {"rules", std::move(rules)},
           {"failures", std::move(failures)}};
  if (report.snapshot) out["snapshot"] = to_json(*report.snapshot);

  if (report.layout) {
    json categories = json::array();
    for (const auto& c : report.layout->categories) {
      json matches = json::array();
      for (const auto& m : c.matches) {
        matches.push_back({{"predicted", m.predicted_index},
                           {"reference", m.reference_index},
                           {"iou", m.iou}});
      }
      categories.push_back({{"category", std::string(vc::to_string(c.category))},
                            {"score", c.score},
                            {"weight", c.weight},
                            {"predicted_count", c.predicted_count},
                            {"reference_count", c.reference_count},
                            {"matches", std::move(matches)}});
    }
    out["layout"] = {{"score", report.layout->score}, {"categories", std::move(categories)}};
  }

  if (report.pixel_diff) {
    const auto& d = *report.pixel_diff;
    out["pixel_diff"] = {{"mse", d.mse},
                         {"rmse", d.rmse},
                         {"percentage_difference", d.percentage_difference},
                         {"differing_pixel_fraction", d.differing_pixel_fraction},
                         {"width", d.width},
                         {"height", d.height}};
  }
  return out;
}

json to_json(const vc::EvaluationReport& report) {
  json rules = json::array();
  for (const auto& r : report.rules) rules.push_back(to_json(r));
  json viewports = json::array();
  for (const auto& v : report.viewports) viewports.push_back(to_json(v));
  return json{{"document", report.document},
              {"passed", report.passed()},
              {"rules", std::move(rules)},
              {"viewports", std::move(viewports)}};
}

std::expected<void, vc::EvalError> save_json(const json& value, const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    logger().error("cannot write '{}'", path);
    return std::unexpected(vc::EvalError::LoadFailed);
  }
  out << value.dump(2) << '\n';
  if (!out) return std::unexpected(vc::EvalError::LoadFailed);
  return {};
}

}  // namespace vieweval::app

#include <vieweval/app/config.hpp>
#include <vieweval/core/component.hpp>
#include <vieweval/core/logger.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace vieweval::app {

namespace {

constexpr std::string_view kBreakpointPrefix = "breakpoint.";
constexpr std::string_view kWeightPrefix = "weight.";

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
std::optional<T> parse_number(const std::string& value) {
  T out{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return out;
}

std::optional<double> parse_non_negative(const std::string& value) {
  const auto v = parse_number<double>(value);
  if (!v || !std::isfinite(*v) || *v < 0.0) return std::nullopt;
  return v;
}

std::optional<bool> parse_bool(const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  return std::nullopt;
}

}  // namespace

const core::Breakpoint* EvaluationConfig::find_breakpoint(std::string_view name) const {
  const auto it = std::find_if(breakpoints.begin(), breakpoints.end(),
                               [name](const core::Breakpoint& b) { return b.name == name; });
  return it == breakpoints.end() ? nullptr : &*it;
}

EvaluationConfig default_config() {
  EvaluationConfig c;
  c.breakpoints = {{"mobile", 375}, {"tablet", 1024}, {"desktop", 1280}};
  c.thresholds = rules::RuleThresholds{};
  c.merge_text_blocks = true;
  c.num_workers = 0;
  c.log_level = "info";
  return c;
}

std::expected<EvaluationConfig, core::EvalError> parse_config(std::string_view text) {
  using core::EvalError;

  EvaluationConfig c = default_config();
  bool custom_breakpoints = false;

  std::istringstream in{std::string(text)};
  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      logger().warn("config line {}: expected key=value, ignored", line_no);
      continue;
    }

    auto invalid = [&]() {
      logger().error("config line {}: invalid value '{}' for '{}'", line_no, value, key);
      return std::unexpected(EvalError::InvalidConfig);
    };

    if (key.starts_with(kBreakpointPrefix)) {
      const std::string name = key.substr(kBreakpointPrefix.size());
      const auto width = parse_number<std::uint32_t>(value);
      if (name.empty() || !width || *width == 0) return invalid();
      if (!custom_breakpoints) {
        c.breakpoints.clear();
        custom_breakpoints = true;
      }
      c.breakpoints.erase(std::remove_if(c.breakpoints.begin(), c.breakpoints.end(),
                                         [&name](const core::Breakpoint& b) { return b.name == name; }),
                          c.breakpoints.end());
      c.breakpoints.push_back({name, *width});
    } else if (key.starts_with(kWeightPrefix)) {
      const auto category = core::parse_category(key.substr(kWeightPrefix.size()));
      const auto weight = parse_number<double>(value);
      if (!category || !weight) return invalid();
      if (!c.weights.set(*category, *weight)) return invalid();
    } else if (key == "min_font_size_px" || key == "min_tap_target_px" ||
               key == "min_line_height_ratio" || key == "normal_line_height_factor" ||
               key == "min_relative_unit_ratio" || key == "root_font_size_px") {
      const auto v = parse_non_negative(value);
      if (!v) return invalid();
      if (key == "min_font_size_px") c.thresholds.min_font_size_px = *v;
      else if (key == "min_tap_target_px") c.thresholds.min_tap_target_px = *v;
      else if (key == "min_line_height_ratio") c.thresholds.min_line_height_ratio = *v;
      else if (key == "normal_line_height_factor") c.thresholds.normal_line_height_factor = *v;
      else if (key == "min_relative_unit_ratio") c.thresholds.min_relative_unit_ratio = *v;
      else c.thresholds.root_font_size_px = *v;
    } else if (key == "merge_text_blocks") {
      const auto v = parse_bool(value);
      if (!v) return invalid();
      c.merge_text_blocks = *v;
    } else if (key == "min_layout_similarity") {
      const auto v = parse_non_negative(value);
      if (!v || *v > 1.0) return invalid();
      c.min_layout_similarity = *v;
    } else if (key == "max_pixel_difference_percent") {
      const auto v = parse_non_negative(value);
      if (!v || *v > 100.0) return invalid();
      c.max_pixel_difference_percent = *v;
    } else if (key == "num_workers") {
      const auto v = parse_number<std::size_t>(value);
      if (!v) return invalid();
      c.num_workers = *v;
    } else if (key == "log_level") {
      c.log_level = value;
    } else {
      logger().warn("config line {}: unknown key '{}' ignored", line_no, key);
    }
  }
  return c;
}

std::expected<EvaluationConfig, core::EvalError> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    logger().error("cannot open config '{}'", path);
    return std::unexpected(core::EvalError::LoadFailed);
  }
  std::ostringstream content;
  content << f.rdbuf();
  return parse_config(content.str());
}

}  // namespace vieweval::app

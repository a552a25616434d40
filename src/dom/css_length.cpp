#include <vieweval/dom/css_length.hpp>
#include <vieweval/dom/html_document.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <utility>

namespace vieweval::dom {

namespace {

constexpr double kCssPxPerInch = 96.0;

constexpr std::pair<std::string_view, LengthUnit> kUnits[] = {
    {"", LengthUnit::None},        {"px", LengthUnit::Px},
    {"pt", LengthUnit::Pt},        {"pc", LengthUnit::Pc},
    {"cm", LengthUnit::Cm},        {"mm", LengthUnit::Mm},
    {"in", LengthUnit::In},        {"q", LengthUnit::Q},
    {"em", LengthUnit::Em},        {"rem", LengthUnit::Rem},
    {"ex", LengthUnit::Ex},        {"ch", LengthUnit::Ch},
    {"%", LengthUnit::Percent},    {"vw", LengthUnit::Vw},
    {"vh", LengthUnit::Vh},        {"vmin", LengthUnit::Vmin},
    {"vmax", LengthUnit::Vmax},    {"fr", LengthUnit::Fr},
};

std::optional<LengthUnit> unit_from_suffix(std::string_view suffix) {
  for (const auto& [name, unit] : kUnits) {
    if (name == suffix) return unit;
  }
  return std::nullopt;
}

}  // namespace

bool is_absolute(LengthUnit unit) noexcept {
  switch (unit) {
    case LengthUnit::Px:
    case LengthUnit::Pt:
    case LengthUnit::Pc:
    case LengthUnit::Cm:
    case LengthUnit::Mm:
    case LengthUnit::In:
    case LengthUnit::Q:
      return true;
    default:
      return false;
  }
}

bool is_relative(LengthUnit unit) noexcept {
  return unit != LengthUnit::None && !is_absolute(unit);
}

std::optional<Length> parse_length(std::string_view token) {
  const std::string text = to_lower(trim(token));
  if (text.empty()) return std::nullopt;

  const char* first = text.data();
  const char* last = text.data() + text.size();
  if (*first == '+') ++first;

  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr == first) return std::nullopt;

  const auto unit = unit_from_suffix(std::string_view(ptr, static_cast<std::size_t>(last - ptr)));
  if (!unit) return std::nullopt;
  return Length{value, *unit};
}

std::optional<double> to_px(const Length& length, const ResolveContext& context) {
  const double v = length.value;
  switch (length.unit) {
    case LengthUnit::Px:
      return v;
    case LengthUnit::Pt:
      return v * kCssPxPerInch / 72.0;
    case LengthUnit::Pc:
      return v * kCssPxPerInch / 6.0;
    case LengthUnit::In:
      return v * kCssPxPerInch;
    case LengthUnit::Cm:
      return v * kCssPxPerInch / 2.54;
    case LengthUnit::Mm:
      return v * kCssPxPerInch / 25.4;
    case LengthUnit::Q:
      return v * kCssPxPerInch / 101.6;
    case LengthUnit::Em:
    case LengthUnit::None:
      return v * context.font_size_px;
    case LengthUnit::Rem:
      return v * context.root_font_px;
    case LengthUnit::Ex:
    case LengthUnit::Ch:
      return v * context.font_size_px * 0.5;
    case LengthUnit::Percent:
      return v / 100.0 * context.font_size_px;
    case LengthUnit::Vw:
      if (context.viewport_width <= 0.0) return std::nullopt;
      return v / 100.0 * context.viewport_width;
    case LengthUnit::Vh:
      if (context.viewport_height <= 0.0) return std::nullopt;
      return v / 100.0 * context.viewport_height;
    case LengthUnit::Vmin:
    case LengthUnit::Vmax: {
      if (context.viewport_width <= 0.0 || context.viewport_height <= 0.0) return std::nullopt;
      const double side = length.unit == LengthUnit::Vmin
                              ? std::min(context.viewport_width, context.viewport_height)
                              : std::max(context.viewport_width, context.viewport_height);
      return v / 100.0 * side;
    }
    case LengthUnit::Fr:
      return std::nullopt;
  }
  return std::nullopt;
}

std::vector<Length> lengths_in(std::string_view value) {
  std::string spaced(value);
  for (char& c : spaced) {
    if (c == '(' || c == ')' || c == ',' || c == '/') c = ' ';
  }

  std::vector<Length> out;
  std::size_t i = 0;
  while (i < spaced.size()) {
    while (i < spaced.size() && std::isspace(static_cast<unsigned char>(spaced[i]))) ++i;
    const std::size_t start = i;
    while (i < spaced.size() && !std::isspace(static_cast<unsigned char>(spaced[i]))) ++i;
    if (i == start) continue;
    const auto length = parse_length(std::string_view(spaced).substr(start, i - start));
    if (!length || length->unit == LengthUnit::None || length->value == 0.0) continue;
    out.push_back(*length);
  }
  return out;
}

}  // namespace vieweval::dom

#include <vieweval/core/component.hpp>
#include <algorithm>

namespace vieweval::core {

std::string_view to_string(ComponentCategory c) noexcept {
  switch (c) {
    case ComponentCategory::Video:
      return "video";
    case ComponentCategory::Image:
      return "image";
    case ComponentCategory::TextBlock:
      return "text_block";
    case ComponentCategory::FormTable:
      return "form_table";
    case ComponentCategory::Button:
      return "button";
    case ComponentCategory::NavBar:
      return "nav_bar";
    case ComponentCategory::Divider:
      return "divider";
  }
  return "unknown";
}

std::optional<ComponentCategory> parse_category(std::string_view name) noexcept {
  for (const auto c : kAllComponentCategories) {
    if (to_string(c) == name) return c;
  }
  return std::nullopt;
}

std::size_t LayoutSnapshot::count(ComponentCategory c) const noexcept {
  return static_cast<std::size_t>(std::count_if(
      components.begin(), components.end(),
      [c](const VisualComponent& v) { return v.category == c; }));
}

}  // namespace vieweval::core

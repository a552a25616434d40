#pragma once

#include <vieweval/core/geometry.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vieweval::core {

/// Visual component kind used for layout comparison.
enum class ComponentCategory : std::uint8_t {
  Video,
  Image,
  TextBlock,
  FormTable,
  Button,
  NavBar,
  Divider,
};

inline constexpr std::size_t kComponentCategoryCount = 7;

inline constexpr std::array<ComponentCategory, kComponentCategoryCount>
    kAllComponentCategories = {
        ComponentCategory::Video,     ComponentCategory::Image,
        ComponentCategory::TextBlock, ComponentCategory::FormTable,
        ComponentCategory::Button,    ComponentCategory::NavBar,
        ComponentCategory::Divider,
};

[[nodiscard]] constexpr std::size_t index_of(ComponentCategory c) noexcept {
  return static_cast<std::size_t>(c);
}

/// "video", "image", "text_block", "form_table", "button", "nav_bar", "divider".
[[nodiscard]] std::string_view to_string(ComponentCategory c) noexcept;

/// Inverse of to_string; nullopt for names outside the enumeration.
[[nodiscard]] std::optional<ComponentCategory> parse_category(std::string_view name) noexcept;

/// One detected UI element measured at one viewport.
struct VisualComponent {
  ComponentCategory category{ComponentCategory::TextBlock};
  BBox bbox{};
  std::string source_viewport;
  std::string element_id;  // CSS path of the measured element
  std::string text;        // text blocks only
};

/// Components extracted from one document at one viewport. Order carries no meaning.
struct LayoutSnapshot {
  std::string viewport;
  std::vector<VisualComponent> components;

  [[nodiscard]] bool empty() const noexcept { return components.empty(); }
  [[nodiscard]] std::size_t count(ComponentCategory c) const noexcept;
};

}  // namespace vieweval::core

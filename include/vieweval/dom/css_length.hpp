#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace vieweval::dom {

enum class LengthUnit : std::uint8_t {
  None,  // unitless number
  Px,
  Pt,
  Pc,
  Cm,
  Mm,
  In,
  Q,
  Em,
  Rem,
  Ex,
  Ch,
  Percent,
  Vw,
  Vh,
  Vmin,
  Vmax,
  Fr,
};

struct Length {
  double value{0.0};
  LengthUnit unit{LengthUnit::None};
};

/// Physical units (px, pt, pc, cm, mm, in, q).
[[nodiscard]] bool is_absolute(LengthUnit unit) noexcept;

/// Font-, container- or viewport-relative units. Unitless numbers are neither.
[[nodiscard]] bool is_relative(LengthUnit unit) noexcept;

/// Parses one CSS length token such as "12px", "1.5em", "50%", ".8rem" or "1.4".
[[nodiscard]] std::optional<Length> parse_length(std::string_view token);

/// Values needed to turn a length into pixels.
struct ResolveContext {
  double font_size_px{16.0};   // element (or parent, for font-size) font size
  double root_font_px{16.0};
  double viewport_width{0.0};
  double viewport_height{0.0};
};

/// Pixel value of a length. Percentages and unitless numbers are taken
/// relative to context.font_size_px (font-size / line-height semantics).
/// nullopt when the unit cannot be resolved (fr, or viewport units without a viewport).
[[nodiscard]] std::optional<double> to_px(const Length& length, const ResolveContext& context);

/// Every length token in a declaration value, including those inside functions
/// such as calc(). Keywords and the bare number 0 are skipped.
[[nodiscard]] std::vector<Length> lengths_in(std::string_view value);

}  // namespace vieweval::dom

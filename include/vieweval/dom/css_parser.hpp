#pragma once

#include <vieweval/dom/html_document.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vieweval::dom {

struct Declaration {
  std::string property;  // lower case
  std::string value;     // trimmed, "!important" removed
};

/// One qualified rule of a stylesheet.
struct StyleRule {
  std::vector<std::string> selectors;  // the comma-separated selector list
  std::vector<Declaration> declarations;
  std::string media;  // condition of the enclosing @media block; empty at top level
};

/// Parses a declaration block body ("width: 50%; color: red").
[[nodiscard]] std::vector<Declaration> parse_declarations(std::string_view block);

/// Parses a stylesheet into its qualified rules. Comments are stripped,
/// @media and @supports blocks are descended into, other at-rules are skipped.
[[nodiscard]] std::vector<StyleRule> parse_stylesheet(std::string_view css);

/// Matches the rightmost compound selector (type, .class, #id, *) against an element.
/// Combinators and ancestors are not checked; pseudo-classes are ignored;
/// attribute selectors never match.
[[nodiscard]] bool selector_matches(std::string_view selector, const Element& element);

/// Last value declared for property, if any.
[[nodiscard]] std::optional<std::string> find_declaration(
    const std::vector<Declaration>& declarations, std::string_view property);

}  // namespace vieweval::dom

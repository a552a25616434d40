#pragma once

#include <vieweval/core/error.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vieweval::dom {

/// One element of the document body, flattened out of the libxml2 tree.
struct Element {
  std::string tag;   // lower case
  std::string path;  // element id, e.g. "div#main > p:nth-of-type(2)"
  std::unordered_map<std::string, std::string> attributes;  // lower-case names
  std::vector<std::string> classes;
  bool has_direct_text{false};  // a child text node with non-whitespace content
  std::string text;             // trimmed text content of the subtree
  std::optional<std::size_t> parent;  // index into HtmlDocument::elements()

  [[nodiscard]] const std::string* attribute(std::string_view name) const;
  [[nodiscard]] bool has_attribute(std::string_view name) const {
    return attribute(name) != nullptr;
  }
  /// Attribute value, or empty when absent.
  [[nodiscard]] std::string_view attribute_or_empty(std::string_view name) const;
  [[nodiscard]] bool has_class(std::string_view token) const noexcept;
};

/// Parsed HTML document. Built by parse(); immutable afterwards and safe to share
/// across threads (the libxml2 tree is released inside parse()).
class HtmlDocument {
 public:
  /// Parse with libxml2's recovering HTML parser. Fails with ExtractionError when
  /// the input is empty or yields no root element.
  [[nodiscard]] static std::expected<HtmlDocument, core::EvalError> parse(
      std::string_view html);

  /// Elements under <body> in document order (body itself first, id "body").
  [[nodiscard]] const std::vector<Element>& elements() const noexcept {
    return elements_;
  }

  [[nodiscard]] const Element* find(std::string_view path) const;

  /// Content of the last <meta name="viewport">, if any.
  [[nodiscard]] const std::optional<std::string>& meta_viewport() const noexcept {
    return meta_viewport_;
  }

  /// Text of every <style> block in document order.
  [[nodiscard]] const std::vector<std::string>& style_sheets() const noexcept {
    return style_sheets_;
  }

 private:
  HtmlDocument() = default;

  friend class DocumentBuilder;

  std::vector<Element> elements_;
  std::unordered_map<std::string, std::size_t> by_path_;
  std::optional<std::string> meta_viewport_;
  std::vector<std::string> style_sheets_;
};

/// Lower-case ASCII copy.
[[nodiscard]] std::string to_lower(std::string_view s);

/// Copy without leading/trailing whitespace.
[[nodiscard]] std::string trim(std::string_view s);

}  // namespace vieweval::dom

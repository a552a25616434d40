#pragma once

#include <vieweval/core/component.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/rendered_viewport.hpp>
#include <vieweval/dom/html_document.hpp>
#include <vieweval/layout/element_classifier.hpp>
#include <expected>
#include <string>
#include <vector>

namespace vieweval::layout {

struct ExtractionOptions {
  bool merge_text_blocks{true};
  double align_tolerance{8.0};
  double adjacency_tolerance{4.0};
};

/// Snapshot plus one diagnostic per classifiable element that had to be skipped.
struct ExtractionResult {
  core::LayoutSnapshot snapshot;
  std::vector<std::string> diagnostics;
};

/// Turns a parsed document and its render dump into a LayoutSnapshot.
/// Invisible and zero-area elements are left out silently; classifiable elements
/// without rendered geometry are left out with a diagnostic.
class ComponentExtractor {
 public:
  explicit ComponentExtractor(ElementClassifier classifier = ElementClassifier::with_default_rules(),
                              ExtractionOptions options = {});

  /// Fails with ExtractionError only when the render dump names no breakpoint.
  [[nodiscard]] std::expected<ExtractionResult, core::EvalError> extract(
      const dom::HtmlDocument& document,
      const core::RenderedViewport& rendered) const;

  [[nodiscard]] const ExtractionOptions& options() const noexcept { return options_; }

 private:
  ElementClassifier classifier_;
  ExtractionOptions options_;
};

/// Collapses text blocks: sorted by (y, x), blocks nested inside another block
/// are dropped and adjacent blocks are merged into one enclosing block.
[[nodiscard]] std::vector<core::VisualComponent> merge_text_blocks(
    std::vector<core::VisualComponent> blocks,
    double align_tolerance = 8.0,
    double adjacency_tolerance = 4.0);

}  // namespace vieweval::layout

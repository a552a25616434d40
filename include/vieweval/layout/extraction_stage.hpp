#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/pipeline_stage.hpp>
#include <vieweval/dom/html_document.hpp>
#include <vieweval/layout/component_extractor.hpp>
#include <expected>
#include <string_view>

namespace vieweval::layout {

/// Extracts the viewport's LayoutSnapshot into the report (snapshot + diagnostics).
/// The document must outlive the stage.
class ExtractionStage : public vieweval::core::IEvaluationStage {
 public:
  ExtractionStage(const dom::HtmlDocument& document, ComponentExtractor extractor);

  [[nodiscard]] std::string_view name() const noexcept override { return "extraction"; }

  [[nodiscard]] std::expected<void, vieweval::core::EvalError> process(
      const vieweval::core::ViewportInput& input,
      vieweval::core::ViewportReport& report) override;

 private:
  const dom::HtmlDocument& document_;
  ComponentExtractor extractor_;
};

}  // namespace vieweval::layout

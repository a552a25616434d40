#include <vieweval/layout/extraction_stage.hpp>
#include <vieweval/core/logger.hpp>
#include <iterator>
#include <utility>

namespace vieweval::layout {

ExtractionStage::ExtractionStage(const dom::HtmlDocument& document,
                                 ComponentExtractor extractor)
    : document_(document), extractor_(std::move(extractor)) {}

std::expected<void, vieweval::core::EvalError> ExtractionStage::process(
    const vieweval::core::ViewportInput& input,
    vieweval::core::ViewportReport& report) {
  auto result = extractor_.extract(document_, input.rendered);
  if (!result) return std::unexpected(result.error());

  for (const auto& d : result->diagnostics) {
    logger().debug("viewport '{}': {}", input.rendered.breakpoint.name, d);
  }
  report.snapshot = std::move(result->snapshot);
  report.diagnostics.insert(report.diagnostics.end(),
                            std::make_move_iterator(result->diagnostics.begin()),
                            std::make_move_iterator(result->diagnostics.end()));
  return {};
}

}  // namespace vieweval::layout

#include <vieweval/layout/component_extractor.hpp>
#include <vieweval/core/geometry.hpp>
#include <vieweval/core/logger.hpp>
#include <algorithm>
#include <deque>
#include <utility>

namespace vieweval::layout {

ComponentExtractor::ComponentExtractor(ElementClassifier classifier,
                                       ExtractionOptions options)
    : classifier_(std::move(classifier)), options_(options) {}

std::expected<ExtractionResult, core::EvalError> ComponentExtractor::extract(
    const dom::HtmlDocument& document,
    const core::RenderedViewport& rendered) const {
  if (rendered.breakpoint.name.empty()) {
    return std::unexpected(core::EvalError::ExtractionError);
  }

  ExtractionResult result;
  result.snapshot.viewport = rendered.breakpoint.name;

  std::vector<core::VisualComponent> text_blocks;
  std::size_t hidden = 0;

  for (const auto& element : document.elements()) {
    const auto category = classifier_.classify(element);
    if (!category) continue;

    const core::ElementGeometry* geometry = rendered.find(element.path);
    if (!geometry) {
      result.diagnostics.push_back(element.path + ": no rendered geometry");
      continue;
    }
    if (!geometry->rendered()) {
      ++hidden;
      continue;
    }

    core::VisualComponent component;
    component.category = *category;
    component.bbox = geometry->bbox;
    component.source_viewport = rendered.breakpoint.name;
    component.element_id = element.path;
    if (*category == core::ComponentCategory::TextBlock) {
      component.text = element.text;
      text_blocks.push_back(std::move(component));
    } else {
      result.snapshot.components.push_back(std::move(component));
    }
  }

  if (options_.merge_text_blocks) {
    text_blocks = merge_text_blocks(std::move(text_blocks), options_.align_tolerance,
                                    options_.adjacency_tolerance);
  }
  for (auto& block : text_blocks) {
    result.snapshot.components.push_back(std::move(block));
  }

  logger().debug("viewport '{}': extracted {} components ({} hidden, {} without geometry)",
                 rendered.breakpoint.name, result.snapshot.components.size(), hidden,
                 result.diagnostics.size());
  return result;
}

std::vector<core::VisualComponent> merge_text_blocks(
    std::vector<core::VisualComponent> blocks,
    double align_tolerance,
    double adjacency_tolerance) {
  std::stable_sort(blocks.begin(), blocks.end(),
                   [](const core::VisualComponent& a, const core::VisualComponent& b) {
                     if (a.bbox.y != b.bbox.y) return a.bbox.y < b.bbox.y;
                     return a.bbox.x < b.bbox.x;
                   });

  std::deque<core::VisualComponent> pending(std::make_move_iterator(blocks.begin()),
                                            std::make_move_iterator(blocks.end()));
  std::vector<core::VisualComponent> merged;

  while (!pending.empty()) {
    core::VisualComponent current = std::move(pending.front());
    pending.pop_front();

    bool keep = true;
    std::size_t i = 0;
    while (i < pending.size()) {
      core::VisualComponent& other = pending[i];
      if (core::contains(current.bbox, other.bbox)) {
        pending.erase(pending.begin() + static_cast<std::ptrdiff_t>(i));
        continue;
      }
      if (core::contains(other.bbox, current.bbox)) {
        keep = false;
        break;
      }
      if (core::boxes_adjacent(current.bbox, other.bbox, align_tolerance, adjacency_tolerance)) {
        if (current.bbox.x < other.bbox.x || current.bbox.y < other.bbox.y) {
          current.text += " " + other.text;
        } else {
          current.text = other.text + " " + current.text;
        }
        current.bbox = core::merge(current.bbox, other.bbox);
        pending.erase(pending.begin() + static_cast<std::ptrdiff_t>(i));
        continue;
      }
      ++i;
    }

    if (keep) merged.push_back(std::move(current));
  }
  return merged;
}

}  // namespace vieweval::layout

#pragma once

#include <vieweval/core/component.hpp>
#include <vieweval/dom/html_document.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vieweval::layout {

using ElementPredicate = std::function<bool(const dom::Element&)>;

/// One predicate -> category rule.
struct ClassificationRule {
  std::string name;
  ElementPredicate matches;
  core::ComponentCategory category{core::ComponentCategory::TextBlock};
};

/// Assigns categories by evaluating rules in priority order; the first match wins.
/// Elements that match no rule are unclassified and must be left out of snapshots.
class ElementClassifier {
 public:
  explicit ElementClassifier(std::vector<ClassificationRule> rules);

  /// Tag-name rules first, then role/class/id heuristics, then text blocks.
  [[nodiscard]] static ElementClassifier with_default_rules();

  [[nodiscard]] std::optional<core::ComponentCategory> classify(
      const dom::Element& element) const;

  [[nodiscard]] const std::vector<ClassificationRule>& rules() const noexcept {
    return rules_;
  }

 private:
  std::vector<ClassificationRule> rules_;
};

/// Interactive elements whose rendered box is a tap target.
[[nodiscard]] bool is_interactive(const dom::Element& element);

}  // namespace vieweval::layout

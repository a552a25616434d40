#include <vieweval/core/report.hpp>
#include <algorithm>

namespace vieweval::core {

namespace {

bool all_passed(const std::vector<RuleResult>& rules) noexcept {
  return std::all_of(rules.begin(), rules.end(),
                     [](const RuleResult& r) { return r.passed; });
}

}  // namespace

const CategoryScore* LayoutSimilarity::find(ComponentCategory c) const noexcept {
  for (const auto& s : categories) {
    if (s.category == c) return &s;
  }
  return nullptr;
}

bool ViewportReport::passed() const noexcept {
  return failures.empty() && all_passed(rules);
}

bool EvaluationReport::passed() const noexcept {
  return all_passed(rules) &&
         std::all_of(viewports.begin(), viewports.end(),
                     [](const ViewportReport& v) { return v.passed(); });
}

}  // namespace vieweval::core

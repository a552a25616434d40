#include <vieweval/layout/layout_matcher.hpp>
#include <vieweval/core/geometry.hpp>
#include <vieweval/core/logger.hpp>
#include <algorithm>
#include <cmath>
#include <tuple>

namespace vieweval::layout {

namespace {

struct Candidate {
  double iou;
  double combined_area;
  std::size_t p;
  std::size_t r;
};

/// Components of one category, with their positions in the snapshot.
struct Partition {
  std::vector<core::VisualComponent> components;
  std::vector<std::size_t> snapshot_index;
};

std::array<Partition, core::kComponentCategoryCount> partition(
    const core::LayoutSnapshot& snapshot) {
  std::array<Partition, core::kComponentCategoryCount> out;
  for (std::size_t i = 0; i < snapshot.components.size(); ++i) {
    const auto& c = snapshot.components[i];
    if (c.bbox.degenerate()) continue;
    auto& part = out[core::index_of(c.category)];
    part.components.push_back(c);
    part.snapshot_index.push_back(i);
  }
  return out;
}

}  // namespace

std::expected<void, core::EvalError> CategoryWeights::set(core::ComponentCategory c,
                                                          double weight) {
  if (!std::isfinite(weight) || weight < 0.0) {
    return std::unexpected(core::EvalError::InvalidConfig);
  }
  weights_[core::index_of(c)] = weight;
  return {};
}

CategoryWeights CategoryWeights::scaled(double factor) const {
  CategoryWeights out = *this;
  for (auto& w : out.weights_) w *= factor;
  return out;
}

bool CategoryWeights::valid() const noexcept {
  return std::all_of(weights_.begin(), weights_.end(),
                     [](double w) { return std::isfinite(w) && w >= 0.0; });
}

std::vector<core::MatchedPair> greedy_match(
    std::span<const core::VisualComponent> predicted,
    std::span<const core::VisualComponent> reference) {
  std::vector<Candidate> candidates;
  for (std::size_t p = 0; p < predicted.size(); ++p) {
    for (std::size_t r = 0; r < reference.size(); ++r) {
      const double value = core::iou(predicted[p].bbox, reference[r].bbox);
      if (value <= 0.0) continue;
      candidates.push_back(
          {value, predicted[p].bbox.area() + reference[r].bbox.area(), p, r});
    }
  }

  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.iou != b.iou) return a.iou > b.iou;
    if (a.combined_area != b.combined_area) return a.combined_area > b.combined_area;
    return std::tie(a.p, a.r) < std::tie(b.p, b.r);
  });

  std::vector<bool> p_used(predicted.size(), false);
  std::vector<bool> r_used(reference.size(), false);
  std::vector<core::MatchedPair> matches;
  const std::size_t limit = std::min(predicted.size(), reference.size());
  for (const auto& c : candidates) {
    if (matches.size() == limit) break;
    if (p_used[c.p] || r_used[c.r]) continue;
    p_used[c.p] = true;
    r_used[c.r] = true;
    matches.push_back({c.p, c.r, c.iou});
  }
  return matches;
}

LayoutMatcher::LayoutMatcher(CategoryWeights weights) : weights_(weights) {}

std::expected<core::LayoutSimilarity, core::EvalError> LayoutMatcher::match(
    const core::LayoutSnapshot& predicted,
    const core::LayoutSnapshot& reference) const {
  if (predicted.viewport != reference.viewport) {
    logger().warn("cannot compare layouts of viewport '{}' and '{}'", predicted.viewport,
                  reference.viewport);
    return std::unexpected(core::EvalError::IncompatibleSnapshotError);
  }

  const auto pred_parts = partition(predicted);
  const auto ref_parts = partition(reference);

  core::LayoutSimilarity out;
  double weight_sum = 0.0;
  for (const auto category : core::kAllComponentCategories) {
    const auto& pp = pred_parts[core::index_of(category)];
    const auto& rp = ref_parts[core::index_of(category)];
    const std::size_t denom = std::max(pp.components.size(), rp.components.size());
    if (denom == 0) continue;  // absent from both: neither scored nor penalized

    core::CategoryScore score;
    score.category = category;
    score.predicted_count = pp.components.size();
    score.reference_count = rp.components.size();
    score.weight = weights_.weight(category);

    double iou_sum = 0.0;
    for (auto m : greedy_match(pp.components, rp.components)) {
      iou_sum += m.iou;
      m.predicted_index = pp.snapshot_index[m.predicted_index];
      m.reference_index = rp.snapshot_index[m.reference_index];
      score.matches.push_back(m);
    }
    score.score = iou_sum / static_cast<double>(denom);
    weight_sum += score.weight;
    out.categories.push_back(std::move(score));
  }

  if (out.categories.empty()) {
    out.score = 1.0;
    return out;
  }

  // All present categories weighted 0: fall back to a plain mean.
  const bool uniform = weight_sum <= 0.0;
  const double n = static_cast<double>(out.categories.size());
  double lss = 0.0;
  for (auto& s : out.categories) {
    s.weight = uniform ? 1.0 / n : s.weight / weight_sum;
    lss += s.score * s.weight;
  }
  out.score = std::clamp(lss, 0.0, 1.0);
  return out;
}

}  // namespace vieweval::layout

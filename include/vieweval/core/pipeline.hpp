#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/pipeline_stage.hpp>
#include <vieweval/core/report.hpp>
#include <vieweval/core/viewport_input.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace vieweval::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages over one viewport and collects a ViewportReport.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IEvaluationStage> stage);

  /// Run every stage on one viewport. A stage error is recorded in
  /// ViewportReport::failures and the remaining stages still run.
  /// Fails with InvalidConfig only when the pipeline has no stages.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process()).
  [[nodiscard]] std::expected<ViewportReport, EvalError> run(
      const ViewportInput& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IEvaluationStage>> stages_;
};

}  // namespace vieweval::core

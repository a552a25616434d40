#include <vieweval/core/pipeline.hpp>
#include <vieweval/core/logger.hpp>
#include <chrono>
#include <string>

namespace vieweval::core {

void Pipeline::add_stage(std::unique_ptr<IEvaluationStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<ViewportReport, EvalError> Pipeline::run(
    const ViewportInput& input,
    StageTimingCallback* timing_cb) {
  if (stages_.empty()) {
    return std::unexpected(EvalError::InvalidConfig);
  }

  ViewportReport report;
  report.breakpoint = input.rendered.breakpoint;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(input, report);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      logger().warn("viewport '{}': stage '{}' failed: {}",
                    report.breakpoint.name, stages_[i]->name(),
                    to_string(result.error()));
      report.failures.push_back({std::string(stages_[i]->name()), result.error()});
    }
  }

  return report;
}

}  // namespace vieweval::core

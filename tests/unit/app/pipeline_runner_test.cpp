#include <vieweval/app/pipeline_runner.hpp>
#include <vieweval/core/pipeline.hpp>
#include <vieweval/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace va = vieweval::app;
namespace vc = vieweval::core;

namespace {

/// Records the viewport width as a rule so reports can be traced back to their input.
class WidthProbeStage : public vc::IEvaluationStage {
 public:
  std::string_view name() const noexcept override { return "width_probe"; }
  std::expected<void, vc::EvalError> process(const vc::ViewportInput& input,
                                             vc::ViewportReport& report) override {
    vc::RuleResult r;
    r.rule_id = "probe";
    r.viewport = input.rendered.breakpoint.name;
    r.passed = true;
    r.measured_value = static_cast<double>(input.rendered.breakpoint.width);
    report.rules.push_back(r);
    return {};
  }
};

vc::Pipeline make_probe_pipeline() {
  vc::Pipeline p;
  p.add_stage(std::make_unique<WidthProbeStage>());
  return p;
}

std::vector<vc::ViewportInput> make_inputs(std::size_t n) {
  std::vector<vc::ViewportInput> inputs(n);
  for (std::size_t i = 0; i < n; ++i) {
    inputs[i].rendered.breakpoint = {"bp" + std::to_string(i), static_cast<std::uint32_t>(300 + i)};
  }
  return inputs;
}

}  // namespace

TEST(PipelineRunner, RunViewportReturnsReport) {
  auto pipeline = make_probe_pipeline();
  const auto inputs = make_inputs(1);
  auto report = va::run_viewport(pipeline, inputs[0]);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->breakpoint.name, "bp0");
  ASSERT_EQ(report->rules.size(), 1u);
}

TEST(PipelineRunner, SequentialKeepsOrder) {
  auto pipeline = make_probe_pipeline();
  const auto inputs = make_inputs(4);
  std::vector<std::size_t> order;
  va::run_viewports(pipeline, inputs, [&order](std::size_t index, vc::ViewportReport report) {
    EXPECT_EQ(report.breakpoint.width, 300u + index);
    order.push_back(index);
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3}));
}

TEST(PipelineRunner, ParallelReportsEveryViewportOnce) {
  auto pipeline = make_probe_pipeline();
  const auto inputs = make_inputs(16);
  std::mutex mutex;
  std::vector<std::size_t> seen;
  va::run_viewports_parallel(
      pipeline, inputs,
      [&](std::size_t index, vc::ViewportReport report) {
        EXPECT_EQ(report.breakpoint.name, "bp" + std::to_string(index));
        std::lock_guard lock(mutex);
        seen.push_back(index);
      },
      4);
  std::sort(seen.begin(), seen.end());
  ASSERT_EQ(seen.size(), 16u);
  for (std::size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(seen[i], i);
}

TEST(PipelineRunner, PipelineErrorBecomesFailure) {
  vc::Pipeline empty;
  const auto inputs = make_inputs(2);
  std::vector<vc::ViewportReport> reports(2);
  va::run_viewports_parallel(empty, inputs,
                             [&reports](std::size_t index, vc::ViewportReport report) {
                               reports[index] = std::move(report);
                             },
                             2);
  for (std::size_t i = 0; i < reports.size(); ++i) {
    EXPECT_EQ(reports[i].breakpoint.name, "bp" + std::to_string(i));
    ASSERT_EQ(reports[i].failures.size(), 1u);
    EXPECT_EQ(reports[i].failures[0].stage, "pipeline");
    EXPECT_EQ(reports[i].failures[0].error, vc::EvalError::InvalidConfig);
    EXPECT_FALSE(reports[i].passed());
  }
}

TEST(PipelineRunner, EmptyInputDoesNotCallCallback) {
  auto pipeline = make_probe_pipeline();
  std::atomic<std::size_t> calls{0};
  va::run_viewports_parallel(pipeline, {}, [&calls](std::size_t, vc::ViewportReport) { calls++; });
  EXPECT_EQ(calls.load(), 0u);
}

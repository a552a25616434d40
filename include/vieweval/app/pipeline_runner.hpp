#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/pipeline.hpp>
#include <vieweval/core/report.hpp>
#include <vieweval/core/viewport_input.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace vieweval::app {

/// Callback for each viewport report with the viewport's index in the input vector.
/// May be invoked from worker threads; must be thread-safe if using run_viewports_parallel.
using ViewportReportCallback =
    std::function<void(std::size_t index, vieweval::core::ViewportReport report)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_viewport to get timings.
using StageTimingCallback = vieweval::core::StageTimingCallback;

/// Runs pipeline on a single viewport. No threading; direct call.
[[nodiscard]] std::expected<vieweval::core::ViewportReport, vieweval::core::EvalError>
run_viewport(vieweval::core::Pipeline& pipeline,
             const vieweval::core::ViewportInput& input,
             StageTimingCallback* timing_cb = nullptr);

/// Runs pipeline on every viewport sequentially; calls callback once per viewport.
/// A pipeline that cannot run still yields a report, with the error in its failures.
void run_viewports(vieweval::core::Pipeline& pipeline,
                   const std::vector<vieweval::core::ViewportInput>& inputs,
                   ViewportReportCallback callback);

/// Runs pipeline on every viewport in parallel using a thread pool.
/// Pipeline::run() is called from worker threads; callback may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
/// Returns after every viewport has been reported.
void run_viewports_parallel(vieweval::core::Pipeline& pipeline,
                            const std::vector<vieweval::core::ViewportInput>& inputs,
                            ViewportReportCallback callback,
                            std::size_t num_workers = 0);

}  // namespace vieweval::app

#include <vieweval/app/pipeline_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace vieweval::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

/// Report for one viewport; a pipeline error becomes a failure entry instead of a dropped viewport.
vieweval::core::ViewportReport report_for(vieweval::core::Pipeline& pipeline,
                                          const vieweval::core::ViewportInput& input) {
  auto result = pipeline.run(input);
  if (result) return std::move(*result);

  vieweval::core::ViewportReport report;
  report.breakpoint = input.rendered.breakpoint;
  report.failures.push_back({"pipeline", result.error()});
  return report;
}

}  // namespace

std::expected<vieweval::core::ViewportReport, vieweval::core::EvalError>
run_viewport(vieweval::core::Pipeline& pipeline,
             const vieweval::core::ViewportInput& input,
             StageTimingCallback* timing_cb) {
  return pipeline.run(input, timing_cb);
}

void run_viewports(vieweval::core::Pipeline& pipeline,
                   const std::vector<vieweval::core::ViewportInput>& inputs,
                   ViewportReportCallback callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    callback(i, report_for(pipeline, inputs[i]));
  }
}

void run_viewports_parallel(vieweval::core::Pipeline& pipeline,
                            const std::vector<vieweval::core::ViewportInput>& inputs,
                            ViewportReportCallback callback,
                            std::size_t num_workers) {
  const std::size_t n = inputs.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_viewports(pipeline, inputs, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      callback(idx, report_for(pipeline, inputs[idx]));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace vieweval::app

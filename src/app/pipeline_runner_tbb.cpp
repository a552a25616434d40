#include <vieweval/app/pipeline_runner_tbb.hpp>
#include <vieweval/app/evaluator.hpp>
#include <cstddef>
#include <vector>

#ifdef VIEWEVAL_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace vieweval::app {

void run_documents_tbb(const Evaluator& evaluator,
                       const std::vector<EvaluationRequest>& requests,
                       DocumentReportCallback callback) {
  if (requests.empty() || !callback) return;

  const std::size_t n = requests.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&evaluator, &requests, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          callback(i, evaluator.evaluate(requests[i]));
        }
      });
}

}  // namespace vieweval::app

#endif  // VIEWEVAL_HAS_TBB

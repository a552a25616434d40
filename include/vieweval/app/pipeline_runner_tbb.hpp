#pragma once

#include <vieweval/app/evaluator.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/report.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

#ifdef VIEWEVAL_HAS_TBB

namespace vieweval::app {

/// Callback for each evaluated document in the TBB batch runner; receives the document's
/// index in the request vector and its report or error.
/// May be invoked from TBB worker threads; must be thread-safe.
using DocumentReportCallback = std::function<void(
    std::size_t index,
    std::expected<vieweval::core::EvaluationReport, vieweval::core::EvalError> result)>;

/// Evaluates a batch of documents in parallel using TBB.
///
/// Every request is evaluated exactly once with the same evaluator; a document that fails
/// (bad HTML, invalid config) is reported through the callback with its error, never dropped.
/// Requests are read only.
void run_documents_tbb(const Evaluator& evaluator,
                       const std::vector<EvaluationRequest>& requests,
                       DocumentReportCallback callback);

}  // namespace vieweval::app

#endif  // VIEWEVAL_HAS_TBB

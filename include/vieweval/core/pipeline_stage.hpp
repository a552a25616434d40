#pragma once

#include <vieweval/core/error.hpp>
#include <vieweval/core/report.hpp>
#include <vieweval/core/viewport_input.hpp>
#include <expected>
#include <string_view>

namespace vieweval::core {

/// Abstract evaluation stage: reads the viewport input, adds its findings to the report.
/// Stages run in order; later stages may read what earlier ones wrote (e.g. the snapshot).
/// process() must not modify the stage, so one pipeline can serve several threads.
class IEvaluationStage {
 public:
  virtual ~IEvaluationStage() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<void, EvalError> process(
      const ViewportInput& input, ViewportReport& report) = 0;
};

}  // namespace vieweval::core

#pragma once

#include <string_view>

namespace vieweval::core {

/// Evaluation error codes; used with std::expected for recoverable failures.
enum class EvalError {
  None = 0,
  ExtractionError,            // unusable document or render dump
  IncompatibleSnapshotError,  // compared snapshots come from different viewports
  DimensionMismatchError,     // pixel diff on images of different size
  ValidatorInputError,        // no computed style data at all
  InvalidImage,
  LoadFailed,
  InvalidConfig,
};

[[nodiscard]] std::string_view to_string(EvalError error) noexcept;

}  // namespace vieweval::core

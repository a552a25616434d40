#include <vieweval/core/error.hpp>

namespace vieweval::core {

std::string_view to_string(EvalError error) noexcept {
  switch (error) {
    case EvalError::None:
      return "none";
    case EvalError::ExtractionError:
      return "extraction_error";
    case EvalError::IncompatibleSnapshotError:
      return "incompatible_snapshot";
    case EvalError::DimensionMismatchError:
      return "dimension_mismatch";
    case EvalError::ValidatorInputError:
      return "validator_input";
    case EvalError::InvalidImage:
      return "invalid_image";
    case EvalError::LoadFailed:
      return "load_failed";
    case EvalError::InvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

}  // namespace vieweval::core

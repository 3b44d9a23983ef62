/**
 * @file errors.cpp
 * @brief ErrorCode names
 */

#include "voicesync/errors.hpp"

namespace voicesync {

const char *error_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::DurationUnreconcilable:
    return "DurationUnreconcilable";
  case ErrorCode::SilenceDetectionInconclusive:
    return "SilenceDetectionInconclusive";
  case ErrorCode::InvalidTimingMap:
    return "InvalidTimingMap";
  case ErrorCode::SynthesisFailure:
    return "SynthesisFailure";
  case ErrorCode::ToolkitFailure:
    return "ToolkitFailure";
  case ErrorCode::DecodeFailure:
    return "DecodeFailure";
  case ErrorCode::InvalidInput:
    return "InvalidInput";
  case ErrorCode::IoFailure:
    return "IoFailure";
  case ErrorCode::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

} // namespace voicesync

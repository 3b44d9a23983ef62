/**
 * @file errors.hpp
 * @brief Status codes returned by engine stages and collaborators
 *
 * @details Every stage returns an ErrorCode (Ok == 0) and fills an output
 *          parameter on success. Details are logged where the error is
 *          detected; callers only branch on the code.
 */

#ifndef VOICESYNC_ERRORS_HPP
#define VOICESYNC_ERRORS_HPP

namespace voicesync {

enum class ErrorCode : int {
  Ok = 0,
  DurationUnreconcilable,       //< Stretch factor outside the extended band
  SilenceDetectionInconclusive, //< No silence found (non-fatal)
  InvalidTimingMap,             //< Internal invariant violated (defect)
  SynthesisFailure,             //< TTS collaborator failed
  ToolkitFailure,               //< Media toolkit invocation failed
  DecodeFailure,                //< Audio could not be decoded
  InvalidInput,                 //< Malformed idea, file or parameter
  IoFailure,                    //< Filesystem error
  Cancelled                     //< Abort observed between stages
};

/**
 * @brief Stable name of an error code, used in logs and failure reports.
 */
const char *error_name(ErrorCode code);

/**
 * @brief Whether a code terminates the owning idea.
 * @note SilenceDetectionInconclusive is informational only.
 */
inline bool is_fatal(ErrorCode code) {
  return code != ErrorCode::Ok &&
         code != ErrorCode::SilenceDetectionInconclusive;
}

} // namespace voicesync

#endif // VOICESYNC_ERRORS_HPP

/**
 * @file duration_reconciler.hpp
 * @brief Fits a synthesized voiceover to the length of its video segment
 *
 * @details The rate factor r = d_raw / d_target decides the strategy:
 *
 *          - |r - 1| <= passthrough_epsilon: no stretch, exact fit only
 *
 *          - r inside [stretch_min, stretch_max]: stretch by r
 *
 *          - r inside [extended_min, extended_max]: stretch by the nearest
 *            band limit, then trim or pad symmetrically
 *
 *          - otherwise: DurationUnreconcilable
 *
 *          Every produced track is fitted to round(d_target * rate) samples
 *          so its duration is within one sample of the target.
 */

#ifndef VOICESYNC_DURATION_RECONCILER_HPP
#define VOICESYNC_DURATION_RECONCILER_HPP

#include <cstddef>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

class MediaToolkit;

struct ReconcileParams {
  double stretch_min = 0.85;          //< Lowest factor stretched as-is
  double stretch_max = 1.25;          //< Highest factor stretched as-is
  double extended_min = 0.70;         //< Lowest factor accepted at all
  double extended_max = 1.60;         //< Highest factor accepted at all
  double passthrough_epsilon = 0.001; //< |r - 1| below this skips stretching
  double tolerance_sec = 0.020;       //< Allowed final deviation
  double max_stretch_drift = 0.25;    //< Allowed toolkit output deviation
};

enum class ReconcileMode {
  Passthrough,     //< Close enough, fit only
  Stretch,         //< Stretch by the exact factor
  StretchAndTrim,  //< Stretch by stretch_max, then trim the excess
  StretchAndPad    //< Stretch by stretch_min, then pad with silence
};

/**
 * @struct ReconcilePlan
 * @brief Outcome of the factor analysis, before any audio is touched.
 */
struct ReconcilePlan {
  double factor = 1.0;         //< d_raw / d_target
  double applied_factor = 1.0; //< Factor handed to the toolkit
  double stretched_duration = 0.0; //< Expected duration after stretching
  ReconcileMode mode = ReconcileMode::Passthrough;
};

const char *reconcile_mode_name(ReconcileMode mode);

/**
 * @brief Decide how a raw duration is brought to the target.
 * @param raw_duration Duration of the synthesized track (> 0)
 * @param target_duration Duration of the video segment (> 0)
 * @param params Band limits
 * @param plan Output plan
 * @return Ok, InvalidInput for non-positive durations or inconsistent bands,
 *         DurationUnreconcilable outside the extended band
 */
ErrorCode plan_reconciliation(double raw_duration, double target_duration,
                              const ReconcileParams &params,
                              ReconcilePlan &plan);

/**
 * @brief Trim or pad a track symmetrically to an exact sample count.
 * @note Trimming removes half the excess from each end (the odd sample from
 *       the end); padding adds silence the same way.
 */
AudioTrack fit_to_length(const AudioTrack &track, size_t target_samples);

/**
 * @brief Produce a track whose duration matches target_duration.
 *
 * @param track Raw synthesized track
 * @param target_duration Video segment duration in seconds
 * @param params Band limits and tolerances
 * @param toolkit Media toolkit providing the pitch-preserving stretch
 * @param scratch_dir Per-idea scratch directory for the toolkit
 * @param out Output track (untouched on failure)
 * @param plan_out Optional: receives the plan that was executed
 * @return Ok, DurationUnreconcilable, InvalidInput or ToolkitFailure
 */
ErrorCode reconcile_duration(const AudioTrack &track, double target_duration,
                             const ReconcileParams &params,
                             MediaToolkit &toolkit,
                             const std::string &scratch_dir, AudioTrack &out,
                             ReconcilePlan *plan_out = nullptr);

} // namespace voicesync

#endif // VOICESYNC_DURATION_RECONCILER_HPP

/**
 * @file duration_reconciler.cpp
 * @brief Voiceover duration reconciliation implementation
 */

#include "voicesync/duration_reconciler.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "voicesync/logging.hpp"
#include "voicesync/media_toolkit.hpp"

namespace voicesync {

const char *reconcile_mode_name(ReconcileMode mode) {
  switch (mode) {
  case ReconcileMode::Passthrough:
    return "passthrough";
  case ReconcileMode::Stretch:
    return "stretch";
  case ReconcileMode::StretchAndTrim:
    return "stretch+trim";
  case ReconcileMode::StretchAndPad:
    return "stretch+pad";
  }
  return "unknown";
}

ErrorCode plan_reconciliation(double raw_duration, double target_duration,
                              const ReconcileParams &params,
                              ReconcilePlan &plan) {
  if (!(raw_duration > 0.0) || !(target_duration > 0.0)) {
    LOG_ERROR("Cannot reconcile non-positive durations (raw {:.3f}s, target "
              "{:.3f}s)",
              raw_duration, target_duration);
    return ErrorCode::InvalidInput;
  }

  /// Bands must nest: extended_min <= stretch_min <= 1 <= stretch_max <=
  /// extended_max
  if (!(params.extended_min > 0.0) ||
      params.extended_min > params.stretch_min || params.stretch_min > 1.0 ||
      params.stretch_max < 1.0 || params.stretch_max > params.extended_max) {
    LOG_ERROR("Inconsistent stretch bands [{}, {}] within [{}, {}]",
              params.stretch_min, params.stretch_max, params.extended_min,
              params.extended_max);
    return ErrorCode::InvalidInput;
  }

  const double r = raw_duration / target_duration;
  plan.factor = r;

  if (std::fabs(r - 1.0) <= params.passthrough_epsilon) {
    plan.mode = ReconcileMode::Passthrough;
    plan.applied_factor = 1.0;
  } else if (r >= params.stretch_min && r <= params.stretch_max) {
    plan.mode = ReconcileMode::Stretch;
    plan.applied_factor = r;
  } else if (r > params.stretch_max && r <= params.extended_max) {
    plan.mode = ReconcileMode::StretchAndTrim;
    plan.applied_factor = params.stretch_max;
  } else if (r < params.stretch_min && r >= params.extended_min) {
    plan.mode = ReconcileMode::StretchAndPad;
    plan.applied_factor = params.stretch_min;
  } else {
    LOG_WARN("Rate factor {:.3f} outside [{:.2f}, {:.2f}] ({:.3f}s -> "
             "{:.3f}s)",
             r, params.extended_min, params.extended_max, raw_duration,
             target_duration);
    return ErrorCode::DurationUnreconcilable;
  }

  plan.stretched_duration = raw_duration / plan.applied_factor;
  return ErrorCode::Ok;
}

AudioTrack fit_to_length(const AudioTrack &track, size_t target_samples) {
  AudioTrack out;
  out.sample_rate = track.sample_rate;
  out.channels = track.channels;

  const size_t n = track.samples.size();
  if (n >= target_samples) {
    /// Trim: half from the front, the rest (incl. odd sample) from the back
    const size_t head = (n - target_samples) / 2;
    out.samples.assign(track.samples.begin() + head,
                       track.samples.begin() + head + target_samples);
  } else {
    /// Pad with silence on both sides
    const size_t head = (target_samples - n) / 2;
    out.samples.assign(target_samples, 0.0f);
    std::copy(track.samples.begin(), track.samples.end(),
              out.samples.begin() + head);
  }
  return out;
}

ErrorCode reconcile_duration(const AudioTrack &track, double target_duration,
                             const ReconcileParams &params,
                             MediaToolkit &toolkit,
                             const std::string &scratch_dir, AudioTrack &out,
                             ReconcilePlan *plan_out) {
  if (track.empty()) {
    LOG_ERROR("Cannot reconcile an empty track");
    return ErrorCode::InvalidInput;
  }

  ReconcilePlan plan;
  ErrorCode rc =
      plan_reconciliation(track.duration(), target_duration, params, plan);
  if (rc != ErrorCode::Ok)
    return rc;

  if (plan_out)
    *plan_out = plan;

  LOG_INFO("Reconciling {:.3f}s -> {:.3f}s (factor {:.4f}, {} x{:.4f})",
           track.duration(), target_duration, plan.factor,
           reconcile_mode_name(plan.mode), plan.applied_factor);

  AudioTrack stretched;
  if (plan.mode == ReconcileMode::Passthrough) {
    stretched = track;
  } else {
    TIMER_START(stretch);
    rc = toolkit.stretch(track, plan.applied_factor, scratch_dir, stretched);
    TIMER_END(stretch);
    if (rc != ErrorCode::Ok)
      return rc;
    if (stretched.empty()) {
      LOG_ERROR("Toolkit returned an empty stretched track");
      return ErrorCode::ToolkitFailure;
    }

    const double drift =
        std::fabs(stretched.duration() - plan.stretched_duration);
    if (drift > params.max_stretch_drift) {
      LOG_ERROR("Stretched track is {:.3f}s, expected {:.3f}s (drift {:.3f}s)",
                stretched.duration(), plan.stretched_duration, drift);
      return ErrorCode::ToolkitFailure;
    }
  }

  const auto target_samples = static_cast<size_t>(
      std::llround(target_duration * stretched.sample_rate));
  if (target_samples == 0) {
    LOG_ERROR("Target {:.3f}s is shorter than one sample", target_duration);
    return ErrorCode::InvalidInput;
  }

  AudioTrack fitted = fit_to_length(stretched, target_samples);

  const double deviation = std::fabs(fitted.duration() - target_duration);
  if (deviation > params.tolerance_sec) {
    LOG_ERROR("Reconciled track misses target by {:.1f}ms (sample rate {})",
              deviation * 1000.0, fitted.sample_rate);
    return ErrorCode::DurationUnreconcilable;
  }

  out = std::move(fitted);
  return ErrorCode::Ok;
}

} // namespace voicesync

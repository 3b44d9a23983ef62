/**
 * @file clip_pipeline.cpp
 * @brief Per-idea pipeline implementation
 *
 * @details Each stage either advances the state machine or ends the run
 *          through fail(). Scratch files live in a per-idea directory that
 *          is removed when run() returns, unless KEEP_SCRATCH is set.
 */

#include "voicesync/clip_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "voicesync/idea_loader.hpp"
#include "voicesync/logging.hpp"
#include "voicesync/sync_engine.hpp"
#include "voicesync/system.hpp"
#include "voicesync/timing_map_builder.hpp"

namespace voicesync {

const char *state_name(PipelineState state) {
  switch (state) {
  case PipelineState::Pending:
    return "Pending";
  case PipelineState::AudioAdjusted:
    return "AudioAdjusted";
  case PipelineState::SilenceAnalyzed:
    return "SilenceAnalyzed";
  case PipelineState::TimingBuilt:
    return "TimingBuilt";
  case PipelineState::Merged:
    return "Merged";
  case PipelineState::Done:
    return "Done";
  case PipelineState::Failed:
    return "Failed";
  }
  return "Unknown";
}

namespace {

/// Removes the scratch directory on scope exit unless asked to keep it
class ScratchGuard {
  std::string path_;
  bool keep_;

public:
  ScratchGuard(std::string path, bool keep)
      : path_(std::move(path)), keep_(keep) {}
  ~ScratchGuard() {
    if (!keep_)
      remove_scratch_dir(path_);
  }

  ScratchGuard(const ScratchGuard &) = delete;
  ScratchGuard &operator=(const ScratchGuard &) = delete;
};

constexpr auto BACKOFF_SLICE = std::chrono::milliseconds(50);

} // namespace

// **---- Constructor ----**

ClipPipeline::ClipPipeline(const ClipIdea &idea, size_t index,
                           const EngineConfig &cfg, SpeechSynthesizer &tts,
                           MediaToolkit &toolkit, std::string source_path,
                           std::string output_dir)
    : idea_(idea), index_(index), cfg_(cfg), tts_(tts), toolkit_(toolkit),
      source_path_(std::move(source_path)),
      output_dir_(std::move(output_dir)) {}

// **---- State Helpers ----**

void ClipPipeline::transition(PipelineState next, int percent,
                              const std::string &msg) {
  state_ = next;
  LOG_PHASE("[Idea {}] {} ({}%): {}", index_ + 1, state_name(next), percent,
            msg);
  if (progress_)
    progress_->push({index_, next, percent, msg});
}

void ClipPipeline::fail(ErrorCode code, const std::string &reason,
                        IdeaOutcome &outcome) {
  outcome.code = code;
  outcome.reached = state_;
  outcome.reason = reason;

  if (code == ErrorCode::Cancelled) {
    LOG_WARN("[Idea {}] Cancelled after {}", index_ + 1, state_name(state_));
  } else {
    LOG_ERROR("[Idea {}] Failed after {}: {} ({})", index_ + 1,
              state_name(state_), reason, error_name(code));
  }

  state_ = PipelineState::Failed;
  if (progress_)
    progress_->push({index_, PipelineState::Failed, 100,
                     fmt::format("{}: {}", error_name(code), reason)});
}

bool ClipPipeline::cancelled() const {
  return cancel_ && cancel_->load();
}

bool ClipPipeline::backoff(double seconds) const {
  const auto until = std::chrono::steady_clock::now() +
                     std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::duration<double>(seconds));
  while (std::chrono::steady_clock::now() < until) {
    if (cancelled())
      return false;
    std::this_thread::sleep_for(BACKOFF_SLICE);
  }
  return !cancelled();
}

std::string ClipPipeline::output_stem() const {
  std::string slug = sanitize_filename(idea_.title);
  std::replace(slug.begin(), slug.end(), ' ', '_');
  if (slug.empty())
    slug = "untitled";
  return fmt::format("clip_{:02d}_{}", index_ + 1, slug);
}

// **---- Retries ----**

ErrorCode ClipPipeline::with_retries(const char *what, int attempts,
                                     double delay,
                                     const std::function<ErrorCode()> &op) {
  attempts = std::max(1, attempts);
  ErrorCode rc = ErrorCode::Ok;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (cancelled())
      return ErrorCode::Cancelled;

    rc = op();
    if (rc != ErrorCode::SynthesisFailure && rc != ErrorCode::ToolkitFailure)
      return rc;

    if (attempt < attempts) {
      LOG_WARN("[Idea {}] {} attempt {}/{} failed, retrying in {:.1f}s",
               index_ + 1, what, attempt, attempts, delay);
      if (!backoff(delay))
        return ErrorCode::Cancelled;
      delay *= 2.0;
    }
  }
  return rc;
}

ErrorCode ClipPipeline::toolkit_step(const char *what,
                                     const std::function<ErrorCode()> &op) {
  return with_retries(what, cfg_.toolkit_retries, cfg_.toolkit_backoff_sec,
                      op);
}

ErrorCode ClipPipeline::synthesize_with_retries(const std::string &scratch_dir,
                                                AudioTrack &raw) {
  const std::string text = idea_.script_text();
  int attempt = 0;

  ErrorCode rc = with_retries(
      "Synthesis", cfg_.synth_retries, cfg_.synth_backoff_sec, [&]() {
        ++attempt;
        TIMER_START(synthesize);
        ErrorCode step = tts_.synthesize(text, idea_.voice_style, scratch_dir,
                                         raw);
        TIMER_END(synthesize);
        if (step == ErrorCode::Ok && raw.empty()) {
          LOG_WARN("[Idea {}] Synthesizer returned an empty track",
                   index_ + 1);
          return ErrorCode::SynthesisFailure;
        }
        return step;
      });

  if (rc == ErrorCode::Ok)
    LOG_INFO("[Idea {}] Voiceover: {:.2f}s @ {}Hz (attempt {})", index_ + 1,
             raw.duration(), raw.sample_rate, attempt);
  return rc;
}

// **---- Main Processing ----**

IdeaOutcome ClipPipeline::run() {
  TIMER_START(clip_total);
  namespace fs = std::filesystem;

  IdeaOutcome outcome;
  transition(PipelineState::Pending, 0,
             fmt::format("'{}' [{} - {}]", idea_.title,
                         format_time(idea_.source_start),
                         format_time(idea_.source_end)));

  if (cancelled()) {
    fail(ErrorCode::Cancelled, "cancelled before start", outcome);
    return outcome;
  }

  std::string scratch;
  if (create_scratch_dir(output_dir_, index_, scratch) != ErrorCode::Ok) {
    fail(ErrorCode::IoFailure, "cannot create scratch directory", outcome);
    return outcome;
  }
  ScratchGuard guard(scratch, cfg_.keep_scratch);

  // **----- CUT SOURCE SEGMENT -----**

  const std::string segment_path = (fs::path(scratch) / "segment.mp4").string();
  ErrorCode rc = toolkit_step("Cut", [&]() {
    return toolkit_.cut(source_path_, idea_.source_start, idea_.source_end,
                        segment_path);
  });
  if (rc != ErrorCode::Ok) {
    fail(rc,
         rc == ErrorCode::Cancelled ? "cancelled while cutting"
                                    : "cutting the source segment failed",
         outcome);
    return outcome;
  }

  double target = 0.0;
  rc = toolkit_.media_duration(segment_path, target);
  if (rc != ErrorCode::Ok) {
    fail(rc, "reading the cut segment duration failed", outcome);
    return outcome;
  }
  if (!(target > 0.0)) {
    fail(ErrorCode::ToolkitFailure, "cut segment has no duration", outcome);
    return outcome;
  }
  transition(PipelineState::Pending, 10,
             fmt::format("segment cut ({:.2f}s)", target));

  // **----- SYNTHESIZE -----**

  AudioTrack raw;
  rc = synthesize_with_retries(scratch, raw);
  if (rc != ErrorCode::Ok) {
    fail(rc,
         rc == ErrorCode::Cancelled
             ? "cancelled during synthesis"
             : fmt::format("speech synthesis failed after {} attempt(s)",
                           std::max(1, cfg_.synth_retries)),
         outcome);
    return outcome;
  }
  if (cancelled()) {
    fail(ErrorCode::Cancelled, "cancelled", outcome);
    return outcome;
  }

  // **----- RECONCILE DURATION -----**

  SyncResult sync;
  rc = toolkit_step("Stretch", [&]() {
    return adjust_audio(raw, target, cfg_, toolkit_, scratch, sync);
  });
  if (rc != ErrorCode::Ok) {
    std::string reason;
    if (rc == ErrorCode::DurationUnreconcilable)
      reason = fmt::format("voiceover of {:.2f}s cannot be fitted to {:.2f}s",
                           raw.duration(), target);
    else if (rc == ErrorCode::Cancelled)
      reason = "cancelled while stretching";
    else
      reason = "stretching the voiceover failed";
    fail(rc, reason, outcome);
    return outcome;
  }
  transition(PipelineState::AudioAdjusted, 35,
             fmt::format("{:.2f}s -> {:.2f}s ({} x{:.3f})", sync.raw_duration,
                         sync.audio.duration(),
                         reconcile_mode_name(sync.plan.mode),
                         sync.plan.applied_factor));
  if (cancelled()) {
    fail(ErrorCode::Cancelled, "cancelled", outcome);
    return outcome;
  }

  // **----- SILENCE ANALYSIS -----**

  rc = analyze_silence(cfg_, sync);
  if (rc != ErrorCode::Ok) {
    fail(rc, "silence analysis failed", outcome);
    return outcome;
  }
  transition(PipelineState::SilenceAnalyzed, 45,
             sync.silence_inconclusive
                 ? std::string("no silence found")
                 : fmt::format("{} silent interval(s)", sync.silences.size()));
  if (cancelled()) {
    fail(ErrorCode::Cancelled, "cancelled", outcome);
    return outcome;
  }

  // **----- TIMING MAP -----**

  std::vector<std::string> lines;
  lines.reserve(idea_.lines.size());
  for (const auto &line : idea_.lines)
    lines.push_back(line.text);

  rc = build_timing(lines, cfg_, sync);
  if (rc != ErrorCode::Ok) {
    fail(rc, "building the timing map failed", outcome);
    return outcome;
  }
  transition(PipelineState::TimingBuilt, 60,
             fmt::format("{} phrase(s), {} word(s)",
                         sync.timing.phrases.size(), sync.tokens.size()));
  if (cancelled()) {
    fail(ErrorCode::Cancelled, "cancelled", outcome);
    return outcome;
  }

  // **----- MERGE + SUBTITLES -----**

  const fs::path stem = fs::path(output_dir_) / output_stem();
  const std::string clip_path = stem.string() + ".mp4";
  const std::string timing_path = stem.string() + "_timing.json";

  if (sync.timing.phrases.empty()) {
    rc = toolkit_step("Merge", [&]() {
      return toolkit_.merge(segment_path, sync.audio, scratch, clip_path);
    });
    if (rc != ErrorCode::Ok) {
      fail(rc,
           rc == ErrorCode::Cancelled ? "cancelled while merging"
                                      : "merging voiceover into the clip failed",
           outcome);
      return outcome;
    }
    LOG_WARN("[Idea {}] No phrases; clip rendered without subtitles",
             index_ + 1);
  } else {
    const std::string merged_path =
        (fs::path(scratch) / "merged.mp4").string();
    rc = toolkit_step("Merge", [&]() {
      return toolkit_.merge(segment_path, sync.audio, scratch, merged_path);
    });
    if (rc != ErrorCode::Ok) {
      fail(rc,
           rc == ErrorCode::Cancelled ? "cancelled while merging"
                                      : "merging voiceover into the clip failed",
           outcome);
      return outcome;
    }
    if (cancelled()) {
      fail(ErrorCode::Cancelled, "cancelled", outcome);
      return outcome;
    }
    rc = toolkit_step("Subtitle burn", [&]() {
      return toolkit_.burn_subtitles(merged_path, sync.timing, scratch,
                                     clip_path);
    });
    if (rc != ErrorCode::Ok) {
      fail(rc,
           rc == ErrorCode::Cancelled ? "cancelled while burning subtitles"
                                      : "burning subtitles failed",
           outcome);
      return outcome;
    }
  }
  transition(PipelineState::Merged, 90, fs::path(clip_path).filename().string());

  // **----- PUBLISH -----**

  rc = write_timing_map_json(sync.timing, timing_path);
  if (rc != ErrorCode::Ok) {
    fail(rc, "writing the timing map failed", outcome);
    return outcome;
  }

  outcome.code = ErrorCode::Ok;
  outcome.reason.clear();
  outcome.result.video_path = clip_path;
  outcome.result.timing_path = timing_path;
  outcome.result.audio = std::move(sync.audio);
  outcome.result.timing = std::move(sync.timing);
  outcome.result.idea = idea_;

  transition(PipelineState::Done, 100, "clip ready");
  outcome.reached = PipelineState::Done;

  TIMER_END(clip_total);
  LOG_SUCCESS("[Idea {}] Output saved to: {}", index_ + 1, clip_path);
  return outcome;
}

} // namespace voicesync

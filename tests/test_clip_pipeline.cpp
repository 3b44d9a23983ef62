/**
 * @file test_clip_pipeline.cpp
 * @brief Per-idea state machine with in-process collaborators
 */

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "test_helpers.hpp"
#include "voicesync/clip_pipeline.hpp"
#include "voicesync/config.hpp"
#include "voicesync/progress_queue.hpp"

using namespace voicesync;
using namespace voicesync::test;

namespace fs = std::filesystem;

class ClipPipelineTest : public ::testing::Test {
protected:
  TempDir out;
  FakeToolkit toolkit;
  FakeSynthesizer tts;
  EngineConfig cfg;
  ClipIdea idea;

  void SetUp() override {
    cfg.synth_backoff_sec = 0.0;
    cfg.synth_retries = 3;
    cfg.toolkit_backoff_sec = 0.0;
    cfg.toolkit_retries = 2;

    idea.title = "Rust in: Space?";
    idea.description = "Why the borrow checker went to orbit";
    idea.voice_style = "excited";
    idea.lines = {{0.0, 5.0, "The quick brown fox"},
                  {5.0, 10.0, "jumps over the lazy dog"}};
    idea.source_start = 30.0;
    idea.source_end = 40.0;
  }

  ClipPipeline make(size_t index = 0) {
    return ClipPipeline(idea, index, cfg, tts, toolkit, "source.mp4",
                        out.str());
  }
};

TEST_F(ClipPipelineTest, OutputStemIsNumberedAndSanitized) {
  EXPECT_EQ(make(0).output_stem(), "clip_01_Rust_in_Space");
  EXPECT_EQ(make(11).output_stem(), "clip_12_Rust_in_Space");

  idea.title = "???";
  EXPECT_EQ(make(2).output_stem(), "clip_03_untitled");
}

TEST_F(ClipPipelineTest, SuccessfulRunPublishesClipAndTiming) {
  ProgressQueue progress;
  ClipPipeline pipeline = make();
  pipeline.set_progress_queue(&progress);

  IdeaOutcome outcome = pipeline.run();
  progress.finish();

  ASSERT_TRUE(outcome.ok()) << outcome.reason;
  EXPECT_EQ(outcome.reached, PipelineState::Done);
  EXPECT_EQ(pipeline.state(), PipelineState::Done);

  const ClipResult &r = outcome.result;
  EXPECT_EQ(fs::path(r.video_path).filename().string(),
            "clip_01_Rust_in_Space.mp4");
  EXPECT_TRUE(fs::exists(r.video_path));
  EXPECT_EQ(read_file(r.video_path), "10");
  EXPECT_NEAR(r.audio.duration(), 10.0, 0.020);
  EXPECT_EQ(r.idea.title, idea.title);
  EXPECT_EQ(tts.calls.load(), 1);
  EXPECT_EQ(toolkit.stretch_calls.load(), 1);
  EXPECT_EQ(toolkit.burn_calls.load(), 1);

  std::ifstream in(r.timing_path);
  ASSERT_TRUE(in.good());
  nlohmann::json doc = nlohmann::json::parse(in);
  EXPECT_EQ(doc["track_duration_ms"].get<int64_t>(), 10000);
  EXPECT_EQ(doc["phrases"].size(), r.timing.phrases.size());
  EXPECT_FALSE(doc["cues"].empty());

  /// Scratch space is gone once the run returns
  EXPECT_FALSE(fs::exists(fs::path(out.str()) / ".voicesync_scratch"));

  std::vector<ProgressEvent> events;
  ProgressEvent ev;
  while (progress.pop(ev))
    events.push_back(ev);
  ASSERT_FALSE(events.empty());
  int last_percent = -1;
  for (const auto &e : events) {
    EXPECT_EQ(e.idea_index, 0u);
    EXPECT_GE(e.percent, last_percent);
    last_percent = e.percent;
  }
  EXPECT_EQ(events.back().state, PipelineState::Done);
  EXPECT_EQ(events.back().percent, 100);
}

TEST_F(ClipPipelineTest, KeepScratchLeavesIntermediateFiles) {
  cfg.keep_scratch = true;
  IdeaOutcome outcome = make().run();
  ASSERT_TRUE(outcome.ok()) << outcome.reason;
  EXPECT_TRUE(fs::exists(fs::path(out.str()) / ".voicesync_scratch"));
}

TEST_F(ClipPipelineTest, SynthesisRetriesUntilSuccess) {
  tts.failures_left = 2;
  IdeaOutcome outcome = make().run();
  EXPECT_TRUE(outcome.ok()) << outcome.reason;
  EXPECT_EQ(tts.calls.load(), 3);
}

TEST_F(ClipPipelineTest, SynthesisGivesUpAfterRetries) {
  tts.failures_left = 10;
  IdeaOutcome outcome = make().run();
  EXPECT_EQ(outcome.code, ErrorCode::SynthesisFailure);
  EXPECT_EQ(outcome.reached, PipelineState::Pending);
  EXPECT_EQ(tts.calls.load(), 3);
  EXPECT_FALSE(fs::exists(fs::path(out.str()) / "clip_01_Rust_in_Space.mp4"));
}

TEST_F(ClipPipelineTest, CutFailureIsToolkitFailure) {
  toolkit.fail_cut = true;
  IdeaOutcome outcome = make().run();
  EXPECT_EQ(outcome.code, ErrorCode::ToolkitFailure);
  EXPECT_NE(outcome.reason.find("cutting"), std::string::npos);
  EXPECT_EQ(toolkit.cut_calls.load(), 2);
  EXPECT_EQ(tts.calls.load(), 0);
}

TEST_F(ClipPipelineTest, MergeFailureHappensAfterTiming) {
  toolkit.fail_merge = true;
  ClipPipeline pipeline = make();
  IdeaOutcome outcome = pipeline.run();
  EXPECT_EQ(outcome.code, ErrorCode::ToolkitFailure);
  EXPECT_EQ(outcome.reached, PipelineState::TimingBuilt);
  EXPECT_EQ(pipeline.state(), PipelineState::Failed);
  EXPECT_EQ(toolkit.merge_calls.load(), 2);
  EXPECT_EQ(toolkit.burn_calls.load(), 0);
}

TEST_F(ClipPipelineTest, TransientMergeFailureIsRetried) {
  toolkit.merge_failures_left = 1;
  IdeaOutcome outcome = make().run();
  ASSERT_TRUE(outcome.ok()) << outcome.reason;
  EXPECT_EQ(toolkit.merge_calls.load(), 2);
  EXPECT_EQ(toolkit.burn_calls.load(), 1);
}

TEST_F(ClipPipelineTest, InterruptedMergeCancelsWithoutRetryOrBurn) {
  std::atomic<bool> cancel{false};
  toolkit.interrupt_merge = &cancel;
  ClipPipeline pipeline = make();
  pipeline.set_cancel_flag(&cancel);

  IdeaOutcome outcome = pipeline.run();
  EXPECT_EQ(outcome.code, ErrorCode::Cancelled);
  EXPECT_EQ(outcome.reached, PipelineState::TimingBuilt);
  EXPECT_TRUE(cancel.load());
  EXPECT_EQ(toolkit.merge_calls.load(), 1);
  EXPECT_EQ(toolkit.burn_calls.load(), 0);
  EXPECT_FALSE(fs::exists(fs::path(out.str()) / "clip_01_Rust_in_Space.mp4"));
}

TEST_F(ClipPipelineTest, InterruptedSynthesisIsNotRetried) {
  std::atomic<bool> cancel{false};
  tts.interrupt = &cancel;
  ClipPipeline pipeline = make();
  pipeline.set_cancel_flag(&cancel);

  IdeaOutcome outcome = pipeline.run();
  EXPECT_EQ(outcome.code, ErrorCode::Cancelled);
  EXPECT_EQ(outcome.reason, "cancelled during synthesis");
  EXPECT_EQ(tts.calls.load(), 1);
  EXPECT_EQ(toolkit.stretch_calls.load(), 0);
}

TEST_F(ClipPipelineTest, UnreconcilableVoiceoverFailsTheIdea) {
  tts.duration_for = [](const std::string &) { return 20.0; };
  IdeaOutcome outcome = make().run();
  EXPECT_EQ(outcome.code, ErrorCode::DurationUnreconcilable);
  EXPECT_EQ(toolkit.stretch_calls.load(), 0);
}

TEST_F(ClipPipelineTest, RaisedCancelFlagStopsBeforeAnyWork) {
  std::atomic<bool> cancel{true};
  ClipPipeline pipeline = make();
  pipeline.set_cancel_flag(&cancel);

  IdeaOutcome outcome = pipeline.run();
  EXPECT_EQ(outcome.code, ErrorCode::Cancelled);
  EXPECT_EQ(outcome.reason, "cancelled before start");
  EXPECT_EQ(tts.calls.load(), 0);
}

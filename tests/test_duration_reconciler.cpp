/**
 * @file test_duration_reconciler.cpp
 * @brief Rate factor planning and reconciliation
 */

#include <cmath>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "voicesync/duration_reconciler.hpp"

using namespace voicesync;
using namespace voicesync::test;

// **---- PLANNING ----**

TEST(PlanReconciliation, WithinStretchBandStretchesExactly) {
  ReconcilePlan plan;
  ASSERT_EQ(plan_reconciliation(12.0, 10.0, ReconcileParams{}, plan),
            ErrorCode::Ok);
  EXPECT_EQ(plan.mode, ReconcileMode::Stretch);
  EXPECT_DOUBLE_EQ(plan.factor, 1.2);
  EXPECT_DOUBLE_EQ(plan.applied_factor, 1.2);
  EXPECT_NEAR(plan.stretched_duration, 10.0, 1e-9);
}

TEST(PlanReconciliation, NearlyEqualDurationsPassThrough) {
  ReconcilePlan plan;
  ASSERT_EQ(plan_reconciliation(10.005, 10.0, ReconcileParams{}, plan),
            ErrorCode::Ok);
  EXPECT_EQ(plan.mode, ReconcileMode::Passthrough);
  EXPECT_DOUBLE_EQ(plan.applied_factor, 1.0);
}

TEST(PlanReconciliation, ExtendedBandClampsAndTrims) {
  ReconcileParams params;
  ReconcilePlan plan;
  ASSERT_EQ(plan_reconciliation(14.0, 10.0, params, plan), ErrorCode::Ok);
  EXPECT_EQ(plan.mode, ReconcileMode::StretchAndTrim);
  EXPECT_DOUBLE_EQ(plan.applied_factor, params.stretch_max);
  EXPECT_GT(plan.stretched_duration, 10.0);
}

TEST(PlanReconciliation, ExtendedBandClampsAndPads) {
  ReconcileParams params;
  ReconcilePlan plan;
  ASSERT_EQ(plan_reconciliation(7.5, 10.0, params, plan), ErrorCode::Ok);
  EXPECT_EQ(plan.mode, ReconcileMode::StretchAndPad);
  EXPECT_DOUBLE_EQ(plan.applied_factor, params.stretch_min);
  EXPECT_LT(plan.stretched_duration, 10.0);
}

TEST(PlanReconciliation, OutsideExtendedBandIsUnreconcilable) {
  ReconcilePlan plan;
  EXPECT_EQ(plan_reconciliation(20.0, 10.0, ReconcileParams{}, plan),
            ErrorCode::DurationUnreconcilable);
  EXPECT_EQ(plan_reconciliation(5.0, 10.0, ReconcileParams{}, plan),
            ErrorCode::DurationUnreconcilable);
}

TEST(PlanReconciliation, RejectsBadInput) {
  ReconcilePlan plan;
  EXPECT_EQ(plan_reconciliation(0.0, 10.0, ReconcileParams{}, plan),
            ErrorCode::InvalidInput);
  EXPECT_EQ(plan_reconciliation(10.0, -1.0, ReconcileParams{}, plan),
            ErrorCode::InvalidInput);

  ReconcileParams crossed;
  crossed.stretch_min = 1.1; // above 1.0
  EXPECT_EQ(plan_reconciliation(10.0, 10.0, crossed, plan),
            ErrorCode::InvalidInput);
}

// **---- FIT ----**

TEST(FitToLength, TrimsEvenlyFromBothEnds) {
  AudioTrack t;
  t.sample_rate = 10;
  for (int i = 0; i < 10; ++i)
    t.samples.push_back(static_cast<float>(i));

  AudioTrack out = fit_to_length(t, 6);
  ASSERT_EQ(out.samples.size(), 6u);
  EXPECT_FLOAT_EQ(out.samples.front(), 2.0f);
  EXPECT_FLOAT_EQ(out.samples.back(), 7.0f);
}

TEST(FitToLength, PadsWithSilenceOnBothSides) {
  AudioTrack t;
  t.sample_rate = 10;
  t.samples = {1.0f, 1.0f, 1.0f, 1.0f};

  AudioTrack out = fit_to_length(t, 8);
  ASSERT_EQ(out.samples.size(), 8u);
  EXPECT_FLOAT_EQ(out.samples[0], 0.0f);
  EXPECT_FLOAT_EQ(out.samples[1], 0.0f);
  EXPECT_FLOAT_EQ(out.samples[2], 1.0f);
  EXPECT_FLOAT_EQ(out.samples[5], 1.0f);
  EXPECT_FLOAT_EQ(out.samples[7], 0.0f);
}

// **---- RECONCILE ----**

TEST(ReconcileDuration, EveryFactorInsideExtendedBandHitsTarget) {
  FakeToolkit toolkit;
  ReconcileParams params;
  const double target = 10.0;

  for (double r = params.extended_min; r <= params.extended_max + 1e-9;
       r += 0.05) {
    AudioTrack raw = make_tone(target * r);
    AudioTrack out;
    ASSERT_EQ(reconcile_duration(raw, target, params, toolkit, "", out),
              ErrorCode::Ok)
        << "factor " << r;
    EXPECT_NEAR(out.duration(), target, params.tolerance_sec)
        << "factor " << r;
    EXPECT_EQ(out.sample_rate, raw.sample_rate);
  }
}

TEST(ReconcileDuration, UnreconcilableProducesNoTrack) {
  FakeToolkit toolkit;
  AudioTrack raw = make_tone(20.0);
  AudioTrack out;
  EXPECT_EQ(reconcile_duration(raw, 10.0, ReconcileParams{}, toolkit, "", out),
            ErrorCode::DurationUnreconcilable);
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(toolkit.stretch_calls.load(), 0);
}

TEST(ReconcileDuration, PassthroughSkipsTheToolkit) {
  FakeToolkit toolkit;
  AudioTrack raw = make_tone(10.0);
  AudioTrack out;
  ReconcilePlan plan;
  ASSERT_EQ(reconcile_duration(raw, 10.0, ReconcileParams{}, toolkit, "", out,
                               &plan),
            ErrorCode::Ok);
  EXPECT_EQ(plan.mode, ReconcileMode::Passthrough);
  EXPECT_EQ(toolkit.stretch_calls.load(), 0);
  EXPECT_EQ(out.samples.size(), raw.samples.size());
}

TEST(ReconcileDuration, DriftingToolkitOutputIsRejected) {
  FakeToolkit toolkit;
  toolkit.stretch_bias = 1.1;
  AudioTrack raw = make_tone(12.0);
  AudioTrack out;
  EXPECT_EQ(reconcile_duration(raw, 10.0, ReconcileParams{}, toolkit, "", out),
            ErrorCode::ToolkitFailure);
}

TEST(ReconcileDuration, EmptyTrackIsInvalid) {
  FakeToolkit toolkit;
  AudioTrack out;
  EXPECT_EQ(reconcile_duration(AudioTrack{}, 10.0, ReconcileParams{}, toolkit,
                               "", out),
            ErrorCode::InvalidInput);
}

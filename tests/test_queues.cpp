/**
 * @file test_queues.cpp
 * @brief TaskQueue, ResultCollector and ProgressQueue
 */

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "voicesync/progress_queue.hpp"
#include "voicesync/task_queue.hpp"

using namespace voicesync;

TEST(TaskQueue, DrainsThenReportsDone) {
  TaskQueue q;
  q.push(0);
  q.push(1);
  q.finish();

  size_t idx = 99;
  ASSERT_TRUE(q.pop(idx));
  EXPECT_EQ(idx, 0u);
  ASSERT_TRUE(q.pop(idx));
  EXPECT_EQ(idx, 1u);
  EXPECT_FALSE(q.pop(idx));
}

TEST(TaskQueue, EveryTaskPoppedExactlyOnceAcrossWorkers) {
  TaskQueue q;
  constexpr size_t N = 200;

  std::mutex m;
  std::vector<size_t> seen;
  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&]() {
      size_t idx;
      while (q.pop(idx)) {
        std::lock_guard<std::mutex> lock(m);
        seen.push_back(idx);
      }
    });
  }

  for (size_t i = 0; i < N; ++i)
    q.push(i);
  q.finish();
  for (auto &t : workers)
    t.join();

  std::sort(seen.begin(), seen.end());
  ASSERT_EQ(seen.size(), N);
  for (size_t i = 0; i < N; ++i)
    EXPECT_EQ(seen[i], i);
}

TEST(ResultCollector, SlotsStayInIdeaOrder) {
  ResultCollector results(3);

  IdeaOutcome last;
  last.code = ErrorCode::Ok;
  last.reason.clear();
  results.store(2, std::move(last));

  IdeaOutcome first;
  first.code = ErrorCode::DurationUnreconcilable;
  first.reached = PipelineState::Pending;
  first.reason = "too long";
  results.store(0, std::move(first));

  IdeaOutcome stray;
  stray.code = ErrorCode::Ok;
  results.store(7, std::move(stray));

  auto out = results.extract();
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].code, ErrorCode::DurationUnreconcilable);
  EXPECT_EQ(out[0].reason, "too long");
  EXPECT_EQ(out[1].code, ErrorCode::Cancelled);
  EXPECT_EQ(out[1].reason, "not started");
  EXPECT_TRUE(out[2].ok());
}

TEST(ProgressQueue, DeliversPendingEventsAfterFinish) {
  ProgressQueue q;
  q.push({0, PipelineState::Pending, 0, "start"});
  q.push({0, PipelineState::AudioAdjusted, 35, "stretched"});
  q.finish();
  q.push({1, PipelineState::Done, 100, "late"});

  EXPECT_FALSE(q.is_done());

  ProgressEvent ev;
  ASSERT_TRUE(q.pop(ev));
  EXPECT_EQ(ev.state, PipelineState::Pending);
  ASSERT_TRUE(q.pop(ev));
  EXPECT_EQ(ev.percent, 35);
  EXPECT_EQ(ev.message, "stretched");
  EXPECT_FALSE(q.pop(ev));
  EXPECT_TRUE(q.is_done());
}

TEST(ProgressQueue, ConsumerWakesForProducers) {
  ProgressQueue q;
  std::atomic<int> received{0};

  std::thread consumer([&]() {
    ProgressEvent ev;
    while (q.pop(ev))
      ++received;
  });

  std::vector<std::thread> producers;
  for (size_t p = 0; p < 3; ++p) {
    producers.emplace_back([&q, p]() {
      for (int i = 0; i < 50; ++i)
        q.push({p, PipelineState::TimingBuilt, i, ""});
    });
  }
  for (auto &t : producers)
    t.join();
  q.finish();
  consumer.join();

  EXPECT_EQ(received.load(), 150);
}

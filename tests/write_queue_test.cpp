// Unit tests for the priority write queue
// Tests: capacity shedding, supersession, retries, flush, clear, listeners

#include <gtest/gtest.h>

#include <sessionvault/test_utils.hpp>
#include <sessionvault/write_queue.hpp>

#include <algorithm>
#include <chrono>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sessionvault {
namespace {

using testing::MemoryBackend;
using testing::WaitUntil;

// =============================================================================
// Test Fixture
// =============================================================================

class WriteQueueTest : public ::testing::Test {
 protected:
  void SetUp() override {
    opt_.normal_interval_ms = 10;
    opt_.low_idle_interval_ms = 20;
    opt_.retry_base_delay_ms = 1;
  }

  void TearDown() override {
    if (queue_) queue_->Shutdown();
    queue_.reset();
  }

  WriteQueue& Queue() {
    if (!queue_) queue_ = std::make_unique<WriteQueue>(&backend_, opt_);
    return *queue_;
  }

  // Records every event the queue reports.
  void Record() {
    Queue().AddListener([this](QueueEvent e, const QueueItem& item) {
      std::lock_guard<std::mutex> lock(events_mu_);
      events_.emplace_back(e, item);
    });
  }

  std::vector<QueueItem> EventsOf(QueueEvent kind) {
    std::lock_guard<std::mutex> lock(events_mu_);
    std::vector<QueueItem> out;
    for (const auto& ev : events_) {
      if (ev.first == kind) out.push_back(ev.second);
    }
    return out;
  }

  // Number of kCompleted, kFailed and kDropped events reported for id.
  int TerminalCount(uint64_t id) {
    std::lock_guard<std::mutex> lock(events_mu_);
    int n = 0;
    for (const auto& ev : events_) {
      const bool terminal = ev.first == QueueEvent::kCompleted ||
                            ev.first == QueueEvent::kFailed ||
                            ev.first == QueueEvent::kDropped;
      if (terminal && ev.second.id == id) ++n;
    }
    return n;
  }

  MemoryBackend backend_;
  WriteQueueOptions opt_;
  std::unique_ptr<WriteQueue> queue_;

  std::mutex events_mu_;
  std::vector<std::pair<QueueEvent, QueueItem>> events_;
};

// =============================================================================
// Enqueue & capacity
// =============================================================================

TEST_F(WriteQueueTest, EnqueueWhileStoppedIsPending) {
  auto& q = Queue();
  uint64_t a = q.Enqueue("a", "1");
  uint64_t b = q.Enqueue("b", "2", Priority::kLow);
  EXPECT_LT(a, b);

  auto stats = q.GetStats();
  EXPECT_EQ(stats.pending, 2u);
  EXPECT_EQ(stats.by_priority.normal, 1u);
  EXPECT_EQ(stats.by_priority.low, 1u);
  EXPECT_EQ(backend_.Size(), 0u);

  std::string value;
  EXPECT_EQ(q.PendingValue("a", &value), PendingState::kPut);
  EXPECT_EQ(value, "1");
  EXPECT_EQ(q.PendingValue("missing", &value), PendingState::kNone);
}

TEST_F(WriteQueueTest, CapacityShedsOldestLowItem) {
  opt_.max_size = 5;
  Record();
  auto& q = Queue();

  for (int i = 0; i < 6; ++i) {
    q.Enqueue("low-" + std::to_string(i), "v", Priority::kLow);
  }

  auto dropped = EventsOf(QueueEvent::kDropped);
  ASSERT_EQ(dropped.size(), 1u);
  EXPECT_EQ(dropped[0].key, "low-0");

  auto stats = q.GetStats();
  EXPECT_EQ(stats.pending, 5u);
  EXPECT_EQ(stats.dropped, 1u);
  EXPECT_EQ(q.PendingValue("low-0", nullptr), PendingState::kNone);
}

TEST_F(WriteQueueTest, CapacityNeverShedsUrgentItems) {
  opt_.max_size = 2;
  Record();
  auto& q = Queue();

  q.Enqueue("c", "1", Priority::kCritical);
  q.Enqueue("n1", "1", Priority::kNormal);
  q.Enqueue("n2", "1", Priority::kNormal);
  q.Enqueue("low", "1", Priority::kLow);

  auto dropped = EventsOf(QueueEvent::kDropped);
  ASSERT_EQ(dropped.size(), 1u);
  EXPECT_EQ(dropped[0].key, "low");
  EXPECT_EQ(q.GetStats().pending, 3u);
}

// =============================================================================
// Supersession
// =============================================================================

TEST_F(WriteQueueTest, NewerWriteReplacesWaitingOne) {
  auto& q = Queue();
  q.Enqueue("k", "old", Priority::kCritical);
  q.Enqueue("k", "new", Priority::kLow);

  auto stats = q.GetStats();
  EXPECT_EQ(stats.pending, 1u);
  EXPECT_EQ(stats.superseded, 1u);
  // The replacement keeps the more urgent tier.
  EXPECT_EQ(stats.by_priority.critical, 1u);

  q.Start();
  q.Flush();
  EXPECT_EQ(backend_.Value("k"), "new");
}

TEST_F(WriteQueueTest, DeleteSupersedesPut) {
  ASSERT_TRUE(backend_.Put("k", "stored").ok());
  auto& q = Queue();
  q.Enqueue("k", "v");
  q.EnqueueDelete("k");
  EXPECT_EQ(q.PendingValue("k", nullptr), PendingState::kDelete);
  EXPECT_TRUE(q.PendingKeys("").empty());

  q.Start();
  q.Flush();
  EXPECT_FALSE(backend_.Has("k"));
  EXPECT_EQ(q.PendingValue("k", nullptr), PendingState::kNone);
}

TEST_F(WriteQueueTest, LastWriteWinsWhileEarlierWriteInFlight) {
  backend_.SetWriteDelay(std::chrono::milliseconds(30));
  Record();
  auto& q = Queue();
  q.Start();

  q.Enqueue("k", "first", Priority::kCritical);
  ASSERT_TRUE(WaitUntil([&] { return !EventsOf(QueueEvent::kProcessing).empty(); }));
  q.Enqueue("k", "second", Priority::kCritical);
  q.Flush();

  EXPECT_EQ(backend_.Value("k"), "second");
  EXPECT_EQ(q.GetStats().completed, 2u);
}

TEST_F(WriteQueueTest, ReplacedWriteCompletesWithItsReplacement) {
  Record();
  auto& q = Queue();
  uint64_t first = q.Enqueue("k", "v1");
  uint64_t second = q.Enqueue("k", "v2");
  q.Start();
  q.Flush();

  EXPECT_EQ(backend_.Value("k"), "v2");
  EXPECT_EQ(TerminalCount(first), 1);
  EXPECT_EQ(TerminalCount(second), 1);

  auto completed = EventsOf(QueueEvent::kCompleted);
  ASSERT_EQ(completed.size(), 2u);
  EXPECT_EQ(completed[0].id, first);
  EXPECT_EQ(completed[0].value, "v2");
}

TEST_F(WriteQueueTest, FailedWriteWithNewerPendingFinishesWithIt) {
  backend_.SetWriteDelay(std::chrono::milliseconds(30));
  backend_.FailNext(1);
  Record();
  auto& q = Queue();
  q.Start();

  uint64_t first = q.Enqueue("k", "first", Priority::kCritical);
  ASSERT_TRUE(WaitUntil([&] { return !EventsOf(QueueEvent::kProcessing).empty(); }));
  uint64_t second = q.Enqueue("k", "second", Priority::kCritical);
  q.Flush();

  EXPECT_EQ(backend_.Value("k"), "second");
  EXPECT_TRUE(EventsOf(QueueEvent::kRetry).empty());
  EXPECT_EQ(TerminalCount(first), 1);
  EXPECT_EQ(TerminalCount(second), 1);
  EXPECT_EQ(EventsOf(QueueEvent::kCompleted).size(), 2u);
  EXPECT_EQ(q.GetStats().superseded, 1u);
}

TEST_F(WriteQueueTest, EveryEnqueuedIdGetsOneTerminalEvent) {
  opt_.max_size = 3;
  Record();
  auto& q = Queue();
  std::vector<uint64_t> ids;
  ids.push_back(q.Enqueue("a", "1", Priority::kLow));
  ids.push_back(q.Enqueue("a", "2", Priority::kLow));
  ids.push_back(q.Enqueue("b", "1", Priority::kLow));
  ids.push_back(q.Enqueue("c", "1", Priority::kLow));
  ids.push_back(q.Enqueue("d", "1", Priority::kLow));  // sheds "a" and the id it replaced
  ids.push_back(q.Enqueue("e", "1"));                   // sheds "b"
  ids.push_back(q.Enqueue("e", "2", Priority::kCritical));
  q.Start();
  q.Flush();

  for (uint64_t id : ids) EXPECT_EQ(TerminalCount(id), 1) << "id " << id;
  EXPECT_EQ(EventsOf(QueueEvent::kDropped).size(), 3u);
  EXPECT_FALSE(backend_.Has("a"));
  EXPECT_FALSE(backend_.Has("b"));
  EXPECT_EQ(backend_.Value("e"), "2");
}

TEST_F(WriteQueueTest, PendingKeysListsPutsByPrefix) {
  auto& q = Queue();
  q.Enqueue("records/r1/metadata", "{}");
  q.Enqueue("records/r1/screenshots/chunk-000", "{}");
  q.Enqueue("records/r2/metadata", "{}");
  q.EnqueueDelete("records/r1/objects/summary");

  auto keys = q.PendingKeys("records/r1/");
  ASSERT_EQ(keys.size(), 2u);
  EXPECT_EQ(keys[0], "records/r1/metadata");
  EXPECT_EQ(keys[1], "records/r1/screenshots/chunk-000");
}

// =============================================================================
// Processing
// =============================================================================

TEST_F(WriteQueueTest, FlushDrainsAllTiers) {
  auto& q = Queue();
  q.Start();
  for (int i = 0; i < 20; ++i) {
    q.Enqueue("c" + std::to_string(i), "v", Priority::kCritical);
    q.Enqueue("n" + std::to_string(i), "v", Priority::kNormal);
    q.Enqueue("l" + std::to_string(i), "v", Priority::kLow);
  }
  q.Flush();

  EXPECT_EQ(backend_.Size(), 60u);
  auto stats = q.GetStats();
  EXPECT_EQ(stats.pending, 0u);
  EXPECT_EQ(stats.processing, 0u);
  EXPECT_EQ(stats.completed, 60u);
}

TEST_F(WriteQueueTest, FlushWhenStoppedReturnsImmediately) {
  auto& q = Queue();
  q.Enqueue("a", "1");
  q.Flush();
  EXPECT_EQ(q.GetStats().pending, 1u);
  EXPECT_FALSE(backend_.Has("a"));
}

TEST_F(WriteQueueTest, NormalItemsAreBatched) {
  opt_.normal_interval_ms = 200;
  auto& q = Queue();
  for (int i = 0; i < 10; ++i) q.Enqueue("n" + std::to_string(i), "v");
  q.Start();
  q.Flush();

  EXPECT_EQ(backend_.Size(), 10u);
  EXPECT_EQ(backend_.batches(), 1u);
  EXPECT_EQ(backend_.puts(), 0u);
}

TEST_F(WriteQueueTest, CriticalWrittenBeforeNormal) {
  auto& q = Queue();
  q.Enqueue("normal", "v", Priority::kNormal);
  q.Enqueue("low", "v", Priority::kLow);
  q.Enqueue("critical", "v", Priority::kCritical);
  q.Start();
  q.Flush();

  auto log = backend_.WriteLog();
  ASSERT_EQ(log.size(), 3u);
  EXPECT_EQ(log[0], "critical");
}

TEST_F(WriteQueueTest, ShutdownDrainsAndStops) {
  auto& q = Queue();
  q.Start();
  EXPECT_TRUE(q.IsRunning());
  for (int i = 0; i < 5; ++i) q.Enqueue("k" + std::to_string(i), "v", Priority::kLow);

  q.Shutdown();
  EXPECT_FALSE(q.IsRunning());
  EXPECT_EQ(backend_.Size(), 5u);

  q.Shutdown();  // idempotent
}

TEST_F(WriteQueueTest, ClearDiscardsWaitingItems) {
  Record();
  auto& q = Queue();
  q.Enqueue("a", "1");
  q.Enqueue("b", "2", Priority::kLow);
  q.Enqueue("c", "3", Priority::kCritical);

  EXPECT_EQ(q.Clear(), 3u);
  EXPECT_EQ(q.GetStats().pending, 0u);
  EXPECT_EQ(q.PendingValue("a", nullptr), PendingState::kNone);

  q.Start();
  q.Flush();
  EXPECT_EQ(backend_.Size(), 0u);
  EXPECT_TRUE(EventsOf(QueueEvent::kCompleted).empty());
  EXPECT_EQ(EventsOf(QueueEvent::kDropped).size(), 3u);
  EXPECT_EQ(q.GetStats().dropped, 0u);
}

// =============================================================================
// Retries
// =============================================================================

TEST_F(WriteQueueTest, RetryThenSuccess) {
  Record();
  backend_.FailNext(1);
  auto& q = Queue();
  q.Start();

  q.Enqueue("k", "v", Priority::kCritical);
  q.Flush();

  EXPECT_EQ(backend_.Value("k"), "v");
  auto retries = EventsOf(QueueEvent::kRetry);
  ASSERT_EQ(retries.size(), 1u);
  EXPECT_EQ(retries[0].retries, 1);
  EXPECT_FALSE(retries[0].last_error.empty());
  EXPECT_EQ(EventsOf(QueueEvent::kCompleted).size(), 1u);
  EXPECT_EQ(q.GetStats().failed, 0u);
}

TEST_F(WriteQueueTest, RetryExhaustionFails) {
  opt_.max_retries_normal = 2;
  Record();
  backend_.FailKey("bad");
  auto& q = Queue();
  q.Start();

  q.Enqueue("good", "v");
  q.Enqueue("bad", "v");
  q.Flush();

  EXPECT_EQ(backend_.Value("good"), "v");
  EXPECT_FALSE(backend_.Has("bad"));

  auto failed = EventsOf(QueueEvent::kFailed);
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].key, "bad");
  EXPECT_EQ(failed[0].retries, 2);
  EXPECT_EQ(EventsOf(QueueEvent::kRetry).size(), 2u);

  auto stats = q.GetStats();
  EXPECT_EQ(stats.failed, 1u);
  EXPECT_EQ(stats.completed, 1u);
  EXPECT_EQ(stats.pending, 0u);
}

TEST_F(WriteQueueTest, CriticalGetsOneRetry) {
  Record();
  backend_.FailKey("k");
  auto& q = Queue();
  q.Start();
  q.Enqueue("k", "v", Priority::kCritical);
  q.Flush();

  EXPECT_EQ(EventsOf(QueueEvent::kRetry).size(), 1u);
  EXPECT_EQ(EventsOf(QueueEvent::kFailed).size(), 1u);
}

TEST_F(WriteQueueTest, RetryDelayDoubles) {
  opt_.retry_base_delay_ms = 40;
  opt_.max_retries_critical = 3;
  backend_.FailKey("k");

  std::mutex mu;
  std::vector<std::chrono::steady_clock::time_point> attempts;
  auto& q = Queue();
  q.AddListener([&](QueueEvent e, const QueueItem&) {
    if (e != QueueEvent::kProcessing) return;
    std::lock_guard<std::mutex> lock(mu);
    attempts.push_back(std::chrono::steady_clock::now());
  });
  q.Start();
  q.Enqueue("k", "v", Priority::kCritical);
  q.Flush();

  std::lock_guard<std::mutex> lock(mu);
  ASSERT_EQ(attempts.size(), 4u);
  for (size_t i = 1; i < attempts.size(); ++i) {
    auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(
        attempts[i] - attempts[i - 1]);
    EXPECT_GE(gap.count(), static_cast<int64_t>(40u << (i - 1))) << "retry " << i;
  }
  EXPECT_EQ(q.GetStats().failed, 1u);
}

// =============================================================================
// Listeners
// =============================================================================

TEST_F(WriteQueueTest, ListenerExceptionIsContained) {
  auto& q = Queue();
  q.AddListener([](QueueEvent, const QueueItem&) { throw std::runtime_error("boom"); });
  std::atomic<int> completed{0};
  q.AddListener([&](QueueEvent e, const QueueItem&) {
    if (e == QueueEvent::kCompleted) ++completed;
  });

  q.Start();
  q.Enqueue("k", "v", Priority::kCritical);
  q.Flush();
  EXPECT_EQ(backend_.Value("k"), "v");
  EXPECT_TRUE(WaitUntil([&] { return completed.load() == 1; }));
}

TEST_F(WriteQueueTest, RemoveListener) {
  auto& q = Queue();
  std::atomic<int> calls{0};
  uint64_t id = q.AddListener([&](QueueEvent, const QueueItem&) { ++calls; });
  q.Enqueue("a", "1");
  EXPECT_EQ(calls.load(), 1);

  EXPECT_TRUE(q.RemoveListener(id));
  EXPECT_FALSE(q.RemoveListener(id));
  q.Enqueue("b", "1");
  EXPECT_EQ(calls.load(), 1);
}

TEST_F(WriteQueueTest, EventNames) {
  EXPECT_EQ(QueueEventName(QueueEvent::kDropped), "dropped");
  EXPECT_EQ(PriorityName(Priority::kCritical), "critical");
  EXPECT_EQ(PriorityName(Priority::kLow), "low");
}

}  // namespace
}  // namespace sessionvault

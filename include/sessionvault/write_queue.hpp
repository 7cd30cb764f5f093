#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <rocksdb/status.h>

#include <sessionvault/backend.hpp>
#include <sessionvault/clock.hpp>
#include <sessionvault/metrics.hpp>

namespace sessionvault {

/** Persistence urgency. Lower value = more urgent. */
enum class Priority {
  kCritical = 0,  // lifecycle-defining changes; written immediately
  kNormal = 1,    // regular updates; batched
  kLow = 2        // derived or bulk data; written when idle
};

std::string_view PriorityName(Priority p);

struct QueueItem {
  enum class Op { kPut, kDelete };

  uint64_t id = 0;  // monotonically increasing in enqueue order
  Priority priority = Priority::kNormal;
  Op op = Op::kPut;
  std::string key;
  std::string value;
  int retries = 0;
  uint64_t enqueued_at_ms = 0;
  std::string last_error;

  // Older waiting items for the same key that this one replaced.
  std::vector<uint64_t> superseded_ids;
};

enum class QueueEvent { kEnqueued, kProcessing, kCompleted, kRetry, kFailed, kDropped };

std::string_view QueueEventName(QueueEvent e);

using QueueListener = std::function<void(QueueEvent, const QueueItem&)>;

/** Result of WriteQueue::PendingValue. */
enum class PendingState { kNone, kPut, kDelete };

struct QueueStats {
  uint64_t pending = 0;     // waiting, including items scheduled for retry
  uint64_t processing = 0;  // handed to the backend, not yet finished
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t dropped = 0;     // shed for capacity
  uint64_t superseded = 0;  // replaced by a newer write to the same key

  struct {
    uint64_t critical = 0;
    uint64_t normal = 0;
    uint64_t low = 0;
  } by_priority;  // waiting items per tier
};

struct WriteQueueOptions {
  // Waiting items across all tiers before low-priority items are shed.
  uint64_t max_size = 1000;

  // Normal-tier batching window.
  uint64_t normal_interval_ms = 100;

  // Low-tier timer fallback when the queue never goes idle.
  uint64_t low_idle_interval_ms = 500;
  uint64_t low_batch_size = 10;

  // Delay before retry n+1 is retry_base_delay_ms * 2^n.
  uint64_t retry_base_delay_ms = 100;

  int max_retries_critical = 1;
  int max_retries_normal = 3;
  int max_retries_low = 5;

  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Clock> clock;
};

/**
 * sessionvault::WriteQueue
 *
 * Asynchronous, priority-tiered, retrying persistence queue in front of a
 * Backend. Enqueue never blocks on I/O and never rejects. One worker thread
 * per tier:
 *
 *   critical  one item at a time, as soon as it is ready
 *   normal    accumulated for normal_interval_ms, written as one
 *             Backend::Write batch; per-item fallback when the batch fails
 *   low       up to low_batch_size items whenever critical and normal are
 *             idle, or after low_idle_interval_ms regardless
 *
 * Normal and low wait for the critical tier to be idle before dispatching.
 * Items are FIFO within a tier. A newer write to a key replaces the waiting
 * one (keeping the more urgent priority), and an item is never dispatched
 * while an earlier write to the same key is still in flight, so the last
 * enqueued value for a key is the one that lands. Every enqueued id gets
 * exactly one terminal event (kCompleted, kFailed or kDropped); a replaced
 * id gets the terminal event of the write that replaced it.
 */
class WriteQueue {
 public:
  /** The backend must outlive the queue. */
  explicit WriteQueue(Backend* backend, WriteQueueOptions opt = WriteQueueOptions{});
  ~WriteQueue();

  WriteQueue(const WriteQueue&) = delete;
  WriteQueue& operator=(const WriteQueue&) = delete;

  /** Launch the worker threads. No-op when already running. */
  void Start();

  /** Drain every queued item, then stop and join the workers. Idempotent. */
  void Shutdown();

  bool IsRunning() const;

  uint64_t Enqueue(std::string key, std::string value, Priority priority = Priority::kNormal);
  uint64_t EnqueueDelete(std::string key, Priority priority = Priority::kNormal);

  /** Block until every item enqueued before the call has finished or failed.
   *  Returns immediately when the workers are not running. */
  void Flush();

  /** Discard waiting items, including retries; each reports kDropped.
   *  In-flight items finish. */
  size_t Clear();

  QueueStats GetStats() const;

  uint64_t AddListener(QueueListener fn);
  bool RemoveListener(uint64_t id);

  /** Latest write for key that has not reached the backend yet. */
  PendingState PendingValue(const std::string& key, std::string* value) const;

  /** Keys starting with prefix whose latest pending write is a put. */
  std::vector<std::string> PendingKeys(std::string_view prefix) const;

 private:
  static constexpr int kTiers = 3;

  struct DelayedItem {
    std::chrono::steady_clock::time_point due;
    QueueItem item;
  };

  struct PendingEntry {
    uint64_t id = 0;
    QueueItem::Op op = QueueItem::Op::kPut;
    std::string value;
  };

  using Events = std::vector<std::pair<QueueEvent, QueueItem>>;

  uint64_t Push(QueueItem item);

  void CriticalLoop();
  void NormalLoop();
  void LowLoop();

  // Waits until the tier has a dispatchable item or the queue is stopping.
  void WaitForWorkLocked(std::unique_lock<std::mutex>& lock, int tier);
  bool HasDispatchableLocked(int tier) const;
  void PromoteDueLocked(int tier);
  bool CriticalIdleLocked() const;
  bool IdleForLowLocked() const;
  bool FlushingLocked() const { return flush_waiters_ > 0 || draining_; }
  bool KeyInFlightLocked(const std::string& key) const;
  uint64_t WaitingLocked() const;
  int MaxRetries(Priority p) const;

  // Takes up to max items from the front of the tier whose keys are not in flight.
  std::vector<QueueItem> TakeLocked(int tier, size_t max);
  void SupersedeLocked(QueueItem* item);
  void ShedLowLocked(Events* events);

  rocksdb::Status Apply(const QueueItem& item);
  void FinishLocked(QueueItem item, const rocksdb::Status& s, Events* events);
  void RetireLocked(const QueueItem& item);
  // Appends ev for item and for every id it superseded.
  void AddTerminalEvents(QueueEvent ev, QueueItem item, Events* events);
  QueueItem* FindWaitingLocked(uint64_t id);

  void Dispatch(const Events& events);
  void EmitGauges() const;

  Backend* backend_;
  WriteQueueOptions opt_;

  mutable std::mutex mu_;
  std::condition_variable cv_;

  std::deque<QueueItem> ready_[kTiers];
  std::vector<DelayedItem> delayed_[kTiers];
  uint64_t in_flight_[kTiers] = {0, 0, 0};
  std::unordered_map<std::string, int> in_flight_keys_;

  std::set<uint64_t> live_ids_;
  std::unordered_map<std::string, PendingEntry> pending_;

  uint64_t next_id_ = 1;
  uint64_t completed_ = 0;
  uint64_t failed_ = 0;
  uint64_t dropped_ = 0;
  uint64_t superseded_ = 0;

  // Serializes Start/Shutdown.
  std::mutex lifecycle_mu_;

  bool running_ = false;
  bool draining_ = false;
  bool stop_ = false;
  int flush_waiters_ = 0;
  std::vector<std::thread> workers_;

  mutable std::mutex listeners_mu_;
  std::map<uint64_t, QueueListener> listeners_;
  uint64_t next_listener_id_ = 1;
};

}  // namespace sessionvault

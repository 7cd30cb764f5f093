#include <sessionvault/write_queue.hpp>

#include <algorithm>
#include <limits>

#include <sessionvault/logging.hpp>

namespace sessionvault {

namespace {

using internal::EmitCounter;
using internal::EmitGauge;
using internal::EmitHistogram;

constexpr int kCritical = static_cast<int>(Priority::kCritical);
constexpr int kNormal = static_cast<int>(Priority::kNormal);
constexpr int kLow = static_cast<int>(Priority::kLow);

}  // namespace

std::string_view PriorityName(Priority p) {
  switch (p) {
    case Priority::kCritical: return "critical";
    case Priority::kNormal:   return "normal";
    case Priority::kLow:      return "low";
  }
  return "unknown";
}

std::string_view QueueEventName(QueueEvent e) {
  switch (e) {
    case QueueEvent::kEnqueued:   return "enqueued";
    case QueueEvent::kProcessing: return "processing";
    case QueueEvent::kCompleted:  return "completed";
    case QueueEvent::kRetry:      return "retry";
    case QueueEvent::kFailed:     return "failed";
    case QueueEvent::kDropped:    return "dropped";
  }
  return "unknown";
}

WriteQueue::WriteQueue(Backend* backend, WriteQueueOptions opt)
    : backend_(backend), opt_(std::move(opt)) {
  if (!opt_.clock) opt_.clock = DefaultClock();
  if (opt_.low_batch_size == 0) opt_.low_batch_size = 1;
}

WriteQueue::~WriteQueue() {
  Shutdown();

  std::lock_guard<std::mutex> lock(mu_);
  if (!live_ids_.empty()) {
    Logger()->warn("queue: destroyed with {} unwritten item(s)", WaitingLocked());
  }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void WriteQueue::Start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  if (running_) return;

  stop_ = false;
  draining_ = false;
  running_ = true;
  workers_.emplace_back(&WriteQueue::CriticalLoop, this);
  workers_.emplace_back(&WriteQueue::NormalLoop, this);
  workers_.emplace_back(&WriteQueue::LowLoop, this);
  Logger()->debug("queue: started ({} waiting)", WaitingLocked());
}

void WriteQueue::Shutdown() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (!running_) return;

    draining_ = true;
    cv_.notify_all();
    if (!live_ids_.empty()) {
      Logger()->info("queue: draining {} item(s) before shutdown", live_ids_.size());
    }
    cv_.wait(lock, [this] { return live_ids_.empty(); });

    stop_ = true;
    cv_.notify_all();
  }

  for (auto& t : workers_) t.join();
  workers_.clear();

  std::lock_guard<std::mutex> lock(mu_);
  running_ = false;
  draining_ = false;
  stop_ = false;
  Logger()->debug("queue: stopped (completed={} failed={} dropped={})",
                  completed_, failed_, dropped_);
}

bool WriteQueue::IsRunning() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

// ---------------------------------------------------------------------------
// Producers
// ---------------------------------------------------------------------------

uint64_t WriteQueue::Enqueue(std::string key, std::string value, Priority priority) {
  QueueItem item;
  item.priority = priority;
  item.op = QueueItem::Op::kPut;
  item.key = std::move(key);
  item.value = std::move(value);
  return Push(std::move(item));
}

uint64_t WriteQueue::EnqueueDelete(std::string key, Priority priority) {
  QueueItem item;
  item.priority = priority;
  item.op = QueueItem::Op::kDelete;
  item.key = std::move(key);
  return Push(std::move(item));
}

uint64_t WriteQueue::Push(QueueItem item) {
  Events events;
  uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    id = next_id_++;
    item.id = id;
    item.enqueued_at_ms = opt_.clock->NowMillis();
    SupersedeLocked(&item);

    live_ids_.insert(id);
    PendingEntry& pe = pending_[item.key];
    pe.id = id;
    pe.op = item.op;
    pe.value = item.op == QueueItem::Op::kPut ? item.value : std::string();

    events.emplace_back(QueueEvent::kEnqueued, item);
    ready_[static_cast<int>(item.priority)].push_back(std::move(item));
    ShedLowLocked(&events);
  }
  cv_.notify_all();

  EmitCounter(opt_.metrics, "sessionvault.queue.enqueued_total", 1);
  EmitGauges();
  Dispatch(events);
  return id;
}

void WriteQueue::SupersedeLocked(QueueItem* item) {
  auto absorb = [&](QueueItem& old) {
    if (static_cast<int>(old.priority) < static_cast<int>(item->priority)) {
      item->priority = old.priority;
    }
    item->superseded_ids.push_back(old.id);
    item->superseded_ids.insert(item->superseded_ids.end(),
                                old.superseded_ids.begin(), old.superseded_ids.end());
    ++superseded_;
  };

  for (int t = 0; t < kTiers; ++t) {
    auto& q = ready_[t];
    for (auto it = q.begin(); it != q.end();) {
      if (it->key == item->key) {
        absorb(*it);
        it = q.erase(it);
      } else {
        ++it;
      }
    }
    auto& d = delayed_[t];
    for (auto it = d.begin(); it != d.end();) {
      if (it->item.key == item->key) {
        absorb(it->item);
        it = d.erase(it);
      } else {
        ++it;
      }
    }
  }
}

void WriteQueue::ShedLowLocked(Events* events) {
  while (WaitingLocked() > opt_.max_size) {
    QueueItem victim;
    if (!ready_[kLow].empty()) {
      victim = std::move(ready_[kLow].front());
      ready_[kLow].pop_front();
    } else if (!delayed_[kLow].empty()) {
      auto oldest = std::min_element(
          delayed_[kLow].begin(), delayed_[kLow].end(),
          [](const DelayedItem& a, const DelayedItem& b) { return a.item.id < b.item.id; });
      victim = std::move(oldest->item);
      delayed_[kLow].erase(oldest);
    } else {
      // Only critical and normal items remain; those are never shed.
      return;
    }

    ++dropped_;
    RetireLocked(victim);
    EmitCounter(opt_.metrics, "sessionvault.queue.dropped_total", 1);
    Logger()->warn("queue: over capacity ({}), dropped low-priority write to {}",
                   opt_.max_size, victim.key);
    AddTerminalEvents(QueueEvent::kDropped, std::move(victim), events);
  }
}

// ---------------------------------------------------------------------------
// Consumers
// ---------------------------------------------------------------------------

void WriteQueue::CriticalLoop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    WaitForWorkLocked(lock, kCritical);
    if (stop_) return;

    auto batch = TakeLocked(kCritical, 1);
    if (batch.empty()) continue;
    QueueItem item = std::move(batch.front());

    lock.unlock();
    Dispatch(Events{{QueueEvent::kProcessing, item}});
    rocksdb::Status s = Apply(item);

    Events events;
    lock.lock();
    FinishLocked(std::move(item), s, &events);
    cv_.notify_all();
    lock.unlock();
    Dispatch(events);
    lock.lock();
  }
}

void WriteQueue::NormalLoop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    WaitForWorkLocked(lock, kNormal);
    if (stop_) return;

    // Accumulate a batch unless someone is waiting for the queue to drain.
    if (!FlushingLocked()) {
      cv_.wait_for(lock, std::chrono::milliseconds(opt_.normal_interval_ms),
                   [this] { return stop_ || FlushingLocked(); });
    }
    cv_.wait(lock, [this] { return stop_ || CriticalIdleLocked(); });
    if (stop_) return;

    PromoteDueLocked(kNormal);
    auto batch = TakeLocked(kNormal, std::numeric_limits<size_t>::max());
    if (batch.empty()) continue;

    lock.unlock();
    Events processing;
    std::vector<WriteOp> ops;
    ops.reserve(batch.size());
    for (const auto& item : batch) {
      processing.emplace_back(QueueEvent::kProcessing, item);
      ops.push_back(item.op == QueueItem::Op::kPut ? WriteOp::Put(item.key, item.value)
                                                   : WriteOp::Delete(item.key));
    }
    Dispatch(processing);

    const uint64_t start_us = internal::NowMicros();
    rocksdb::Status bs = backend_->Write(ops);
    std::vector<rocksdb::Status> results(batch.size(), bs);
    if (!bs.ok()) {
      Logger()->warn("queue: batch of {} failed ({}), writing items individually",
                     batch.size(), bs.ToString());
      for (size_t i = 0; i < batch.size(); ++i) results[i] = Apply(batch[i]);
    }
    EmitHistogram(opt_.metrics, "sessionvault.queue.batch_size", batch.size());
    EmitHistogram(opt_.metrics, "sessionvault.queue.batch_latency_us",
                  internal::NowMicros() - start_us);

    Events events;
    lock.lock();
    for (size_t i = 0; i < batch.size(); ++i) {
      FinishLocked(std::move(batch[i]), results[i], &events);
    }
    cv_.notify_all();
    lock.unlock();
    Dispatch(events);
    lock.lock();
  }
}

void WriteQueue::LowLoop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    WaitForWorkLocked(lock, kLow);
    if (stop_) return;

    // Prefer idle periods; fall back to the timer when the queue stays busy.
    cv_.wait_for(lock, std::chrono::milliseconds(opt_.low_idle_interval_ms),
                 [this] { return stop_ || FlushingLocked() || IdleForLowLocked(); });
    cv_.wait(lock, [this] { return stop_ || CriticalIdleLocked(); });
    if (stop_) return;

    PromoteDueLocked(kLow);
    auto batch = TakeLocked(kLow, opt_.low_batch_size);
    if (batch.empty()) continue;

    for (auto& item : batch) {
      lock.unlock();
      Dispatch(Events{{QueueEvent::kProcessing, item}});
      rocksdb::Status s = Apply(item);

      Events events;
      lock.lock();
      FinishLocked(std::move(item), s, &events);
      cv_.notify_all();
      lock.unlock();
      Dispatch(events);
      lock.lock();
    }
  }
}

void WriteQueue::WaitForWorkLocked(std::unique_lock<std::mutex>& lock, int tier) {
  while (true) {
    PromoteDueLocked(tier);
    if (stop_ || HasDispatchableLocked(tier)) return;

    const auto& d = delayed_[tier];
    if (d.empty()) {
      cv_.wait(lock);
    } else {
      auto next = std::min_element(
          d.begin(), d.end(),
          [](const DelayedItem& a, const DelayedItem& b) { return a.due < b.due; });
      cv_.wait_until(lock, next->due);
    }
  }
}

bool WriteQueue::HasDispatchableLocked(int tier) const {
  const auto& q = ready_[tier];
  return !q.empty() && !KeyInFlightLocked(q.front().key);
}

void WriteQueue::PromoteDueLocked(int tier) {
  auto& d = delayed_[tier];
  if (d.empty()) return;

  const auto now = std::chrono::steady_clock::now();
  std::vector<QueueItem> due;
  for (auto it = d.begin(); it != d.end();) {
    if (it->due <= now) {
      due.push_back(std::move(it->item));
      it = d.erase(it);
    } else {
      ++it;
    }
  }
  std::sort(due.begin(), due.end(),
            [](const QueueItem& a, const QueueItem& b) { return a.id < b.id; });
  for (auto& item : due) ready_[tier].push_back(std::move(item));
}

bool WriteQueue::CriticalIdleLocked() const {
  return ready_[kCritical].empty() && in_flight_[kCritical] == 0;
}

bool WriteQueue::IdleForLowLocked() const {
  return CriticalIdleLocked() && ready_[kNormal].empty() && in_flight_[kNormal] == 0;
}

bool WriteQueue::KeyInFlightLocked(const std::string& key) const {
  return in_flight_keys_.find(key) != in_flight_keys_.end();
}

uint64_t WriteQueue::WaitingLocked() const {
  uint64_t n = 0;
  for (int t = 0; t < kTiers; ++t) n += ready_[t].size() + delayed_[t].size();
  return n;
}

int WriteQueue::MaxRetries(Priority p) const {
  switch (p) {
    case Priority::kCritical: return opt_.max_retries_critical;
    case Priority::kNormal:   return opt_.max_retries_normal;
    case Priority::kLow:      return opt_.max_retries_low;
  }
  return 0;
}

std::vector<QueueItem> WriteQueue::TakeLocked(int tier, size_t max) {
  std::vector<QueueItem> out;
  auto& q = ready_[tier];
  while (!q.empty() && out.size() < max && !KeyInFlightLocked(q.front().key)) {
    ++in_flight_keys_[q.front().key];
    out.push_back(std::move(q.front()));
    q.pop_front();
  }
  in_flight_[tier] += out.size();
  return out;
}

rocksdb::Status WriteQueue::Apply(const QueueItem& item) {
  if (item.op == QueueItem::Op::kDelete) return backend_->Delete(item.key);
  return backend_->Put(item.key, item.value);
}

void WriteQueue::FinishLocked(QueueItem item, const rocksdb::Status& s, Events* events) {
  const int tier = static_cast<int>(item.priority);
  --in_flight_[tier];
  auto kit = in_flight_keys_.find(item.key);
  if (kit != in_flight_keys_.end() && --kit->second <= 0) in_flight_keys_.erase(kit);

  if (s.ok()) {
    ++completed_;
    const uint64_t now = opt_.clock->NowMillis();
    EmitCounter(opt_.metrics, "sessionvault.queue.completed_total", 1);
    EmitHistogram(opt_.metrics, "sessionvault.queue.latency_ms",
                  now > item.enqueued_at_ms ? now - item.enqueued_at_ms : 0);
    RetireLocked(item);
    AddTerminalEvents(QueueEvent::kCompleted, std::move(item), events);
    return;
  }

  item.last_error = s.ToString();

  auto pit = pending_.find(item.key);
  if (pit != pending_.end() && pit->second.id > item.id) {
    // A newer write to this key is already queued; retrying would clobber it.
    // The failed ids now finish with the newer write.
    QueueItem* newer = FindWaitingLocked(pit->second.id);
    if (newer != nullptr) {
      ++superseded_;
      Logger()->debug("queue: write {} to {} failed and was superseded by {}",
                      item.id, item.key, newer->id);
      newer->superseded_ids.push_back(item.id);
      newer->superseded_ids.insert(newer->superseded_ids.end(),
                                   item.superseded_ids.begin(), item.superseded_ids.end());
      return;
    }
  }

  if (item.retries < MaxRetries(item.priority)) {
    const int shift = std::min(item.retries, 20);
    const uint64_t delay_ms = opt_.retry_base_delay_ms << shift;
    ++item.retries;
    EmitCounter(opt_.metrics, "sessionvault.queue.retry_total", 1);
    Logger()->debug("queue: {} write to {} failed ({}), retry {} in {} ms",
                    PriorityName(item.priority), item.key, item.last_error,
                    item.retries, delay_ms);
    events->emplace_back(QueueEvent::kRetry, item);
    delayed_[tier].push_back(DelayedItem{
        std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms),
        std::move(item)});
    return;
  }

  ++failed_;
  EmitCounter(opt_.metrics, "sessionvault.queue.failed_total", 1);
  Logger()->error("queue: giving up on {} write to {} after {} retries: {}",
                  PriorityName(item.priority), item.key, item.retries, item.last_error);
  RetireLocked(item);
  AddTerminalEvents(QueueEvent::kFailed, std::move(item), events);
}

void WriteQueue::AddTerminalEvents(QueueEvent ev, QueueItem item, Events* events) {
  for (uint64_t id : item.superseded_ids) {
    QueueItem replaced = item;
    replaced.id = id;
    replaced.superseded_ids.clear();
    events->emplace_back(ev, std::move(replaced));
  }
  events->emplace_back(ev, std::move(item));
}

QueueItem* WriteQueue::FindWaitingLocked(uint64_t id) {
  for (int t = 0; t < kTiers; ++t) {
    for (auto& item : ready_[t]) {
      if (item.id == id) return &item;
    }
    for (auto& d : delayed_[t]) {
      if (d.item.id == id) return &d.item;
    }
  }
  return nullptr;
}

void WriteQueue::RetireLocked(const QueueItem& item) {
  live_ids_.erase(item.id);
  for (uint64_t id : item.superseded_ids) live_ids_.erase(id);

  auto it = pending_.find(item.key);
  if (it != pending_.end() && it->second.id == item.id) pending_.erase(it);
}

// ---------------------------------------------------------------------------
// Control & introspection
// ---------------------------------------------------------------------------

void WriteQueue::Flush() {
  std::unique_lock<std::mutex> lock(mu_);
  if (!running_) {
    if (!live_ids_.empty()) {
      Logger()->warn("queue: flush requested while stopped, {} item(s) waiting",
                     WaitingLocked());
    }
    return;
  }

  const uint64_t target = next_id_ - 1;
  ++flush_waiters_;
  cv_.notify_all();
  cv_.wait(lock, [&] { return live_ids_.empty() || *live_ids_.begin() > target; });
  --flush_waiters_;
}

size_t WriteQueue::Clear() {
  size_t n = 0;
  Events events;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (int t = 0; t < kTiers; ++t) {
      for (auto& item : ready_[t]) {
        RetireLocked(item);
        AddTerminalEvents(QueueEvent::kDropped, std::move(item), &events);
      }
      for (auto& d : delayed_[t]) {
        RetireLocked(d.item);
        AddTerminalEvents(QueueEvent::kDropped, std::move(d.item), &events);
      }
      n += ready_[t].size() + delayed_[t].size();
      ready_[t].clear();
      delayed_[t].clear();
    }
  }
  cv_.notify_all();
  if (n > 0) Logger()->info("queue: cleared {} waiting item(s)", n);
  EmitGauges();
  Dispatch(events);
  return n;
}

QueueStats WriteQueue::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  QueueStats s;
  s.by_priority.critical = ready_[kCritical].size() + delayed_[kCritical].size();
  s.by_priority.normal = ready_[kNormal].size() + delayed_[kNormal].size();
  s.by_priority.low = ready_[kLow].size() + delayed_[kLow].size();
  s.pending = s.by_priority.critical + s.by_priority.normal + s.by_priority.low;
  s.processing = in_flight_[kCritical] + in_flight_[kNormal] + in_flight_[kLow];
  s.completed = completed_;
  s.failed = failed_;
  s.dropped = dropped_;
  s.superseded = superseded_;
  return s;
}

PendingState WriteQueue::PendingValue(const std::string& key, std::string* value) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = pending_.find(key);
  if (it == pending_.end()) return PendingState::kNone;
  if (it->second.op == QueueItem::Op::kDelete) return PendingState::kDelete;
  if (value) *value = it->second.value;
  return PendingState::kPut;
}

std::vector<std::string> WriteQueue::PendingKeys(std::string_view prefix) const {
  std::vector<std::string> out;
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& kv : pending_) {
    if (kv.second.op != QueueItem::Op::kPut) continue;
    if (std::string_view(kv.first).substr(0, prefix.size()) == prefix) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

uint64_t WriteQueue::AddListener(QueueListener fn) {
  std::lock_guard<std::mutex> lock(listeners_mu_);
  const uint64_t id = next_listener_id_++;
  listeners_.emplace(id, std::move(fn));
  return id;
}

bool WriteQueue::RemoveListener(uint64_t id) {
  std::lock_guard<std::mutex> lock(listeners_mu_);
  return listeners_.erase(id) > 0;
}

void WriteQueue::Dispatch(const Events& events) {
  if (events.empty()) return;

  std::vector<QueueListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mu_);
    if (listeners_.empty()) return;
    listeners.reserve(listeners_.size());
    for (const auto& kv : listeners_) listeners.push_back(kv.second);
  }

  for (const auto& ev : events) {
    for (const auto& fn : listeners) {
      try {
        fn(ev.first, ev.second);
      } catch (const std::exception& e) {
        Logger()->error("queue: listener threw on {} event for {}: {}",
                        QueueEventName(ev.first), ev.second.key, e.what());
      }
    }
  }
}

void WriteQueue::EmitGauges() const {
  if (!opt_.metrics) return;
  QueueStats s = GetStats();
  EmitGauge(opt_.metrics, "sessionvault.queue.pending", static_cast<double>(s.pending));
  EmitGauge(opt_.metrics, "sessionvault.queue.processing", static_cast<double>(s.processing));
}

}  // namespace sessionvault

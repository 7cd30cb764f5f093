#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sessionvault/clock.hpp>
#include <sessionvault/logging.hpp>

namespace sessionvault {

// Size charged for a value whose estimator failed.
constexpr size_t kFallbackEntryBytes = 1024;

/**
 * Options for Cache.
 */
struct CacheOptions {
  // Upper bound on the sum of estimated entry sizes.
  uint64_t max_size_bytes = 100ull * 1024ull * 1024ull;

  // Optional item-count bound (0 = unbounded).
  uint64_t max_items = 0;

  // Entries older than this (since their last Set) are treated as misses.
  // 0 disables expiry.
  uint64_t ttl_ms = 0;

  // Time source for TTL and entry timestamps (null = wall clock).
  std::shared_ptr<Clock> clock;
};

struct CacheStats {
  uint64_t hits = 0;
  uint64_t misses = 0;
  double hit_rate = 0.0;            // hits / (hits + misses), 0 when no lookups
  uint64_t size_bytes = 0;
  uint64_t max_size_bytes = 0;
  uint64_t items = 0;
  uint64_t max_items = 0;           // 0 = unbounded
  uint64_t evictions = 0;
  std::optional<uint64_t> oldest_entry_ms;
  std::optional<uint64_t> newest_entry_ms;
};

/**
 * Default best-effort size estimate for a cached value.
 * Specialize, or pass an estimator to Cache, for anything that owns heap data.
 */
template <typename V>
struct DefaultSizeEstimator {
  size_t operator()(const V&) const { return sizeof(V); }
};

template <>
struct DefaultSizeEstimator<std::string> {
  size_t operator()(const std::string& v) const { return v.size(); }
};

/**
 * sessionvault::Cache
 *
 * Byte-bounded least-recently-used cache.
 *
 * A hash map indexes nodes of a doubly-linked recency list (front = most
 * recently used). Get/Set/Delete are O(1); eviction pops from the back until
 * both the byte bound and the optional item bound hold. Pattern invalidation
 * is a linear scan.
 *
 * Thread-safe: one mutex serializes every operation.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class Cache {
 public:
  using SizeEstimator = std::function<size_t(const V&)>;

  explicit Cache(CacheOptions opt = CacheOptions{},
                 SizeEstimator estimator = DefaultSizeEstimator<V>{})
      : opt_(std::move(opt)), estimator_(std::move(estimator)) {
    if (!opt_.clock) opt_.clock = DefaultClock();
  }

  Cache(const Cache&) = delete;
  Cache& operator=(const Cache&) = delete;

  /** Returns the value and marks it most recently used; nullopt on miss or expiry. */
  std::optional<V> Get(const K& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++misses_;
      return std::nullopt;
    }
    if (IsExpiredLocked(*it->second)) {
      EraseLocked(it);
      ++misses_;
      return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    ++hits_;
    return it->second->value;
  }

  /** Inserts or replaces the value at the most recently used position, then evicts. */
  void Set(const K& key, V value) {
    const size_t size = EstimateSize(value);
    const uint64_t now = opt_.clock->NowMillis();

    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it != index_.end()) {
      Entry& e = *it->second;
      size_bytes_ -= e.size_bytes;
      e.value = std::move(value);
      e.size_bytes = size;
      e.timestamp_ms = now;
      size_bytes_ += size;
      lru_.splice(lru_.begin(), lru_, it->second);
    } else {
      lru_.push_front(Entry{key, std::move(value), size, now});
      index_.emplace(key, lru_.begin());
      size_bytes_ += size;
    }
    EvictIfNeededLocked();
  }

  /** True if a live entry exists. Does not change recency or hit counters. */
  bool Contains(const K& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    if (IsExpiredLocked(*it->second)) {
      EraseLocked(it);
      return false;
    }
    return true;
  }

  bool Delete(const K& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    EraseLocked(it);
    return true;
  }

  bool Invalidate(const K& key) { return Delete(key); }

  /** Removes every entry whose key starts with prefix. String-like keys only. */
  size_t InvalidatePattern(std::string_view prefix) {
    return RemoveIf([prefix](std::string_view key) {
      return key.substr(0, prefix.size()) == prefix;
    });
  }

  /** Removes every entry whose key matches the regular expression (search semantics). */
  size_t InvalidatePattern(const std::regex& pattern) {
    return RemoveIf([&pattern](std::string_view key) {
      return std::regex_search(key.begin(), key.end(), pattern);
    });
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mu_);
    lru_.clear();
    index_.clear();
    size_bytes_ = 0;
  }

  /** Drops expired entries, then re-applies the size and item bounds. */
  void Prune() {
    std::lock_guard<std::mutex> lock(mu_);
    if (opt_.ttl_ms > 0) {
      for (auto it = lru_.begin(); it != lru_.end();) {
        auto next = std::next(it);
        if (IsExpiredLocked(*it)) EraseLocked(index_.find(it->key));
        it = next;
      }
    }
    EvictIfNeededLocked();
  }

  /** Changes the byte bound; shrinking evicts immediately. */
  void Resize(uint64_t max_size_bytes) {
    std::lock_guard<std::mutex> lock(mu_);
    opt_.max_size_bytes = max_size_bytes;
    EvictIfNeededLocked();
  }

  std::unordered_map<K, V, Hash> GetMany(const std::vector<K>& keys) {
    std::unordered_map<K, V, Hash> out;
    for (const auto& key : keys) {
      auto v = Get(key);
      if (v) out.emplace(key, std::move(*v));
    }
    return out;
  }

  void SetMany(std::vector<std::pair<K, V>> entries) {
    for (auto& kv : entries) Set(kv.first, std::move(kv.second));
  }

  size_t DeleteMany(const std::vector<K>& keys) {
    size_t count = 0;
    for (const auto& key : keys) {
      if (Delete(key)) ++count;
    }
    return count;
  }

  CacheStats GetStats() const {
    std::lock_guard<std::mutex> lock(mu_);
    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    const uint64_t lookups = hits_ + misses_;
    s.hit_rate = lookups > 0 ? static_cast<double>(hits_) / static_cast<double>(lookups) : 0.0;
    s.size_bytes = size_bytes_;
    s.max_size_bytes = opt_.max_size_bytes;
    s.items = index_.size();
    s.max_items = opt_.max_items;
    s.evictions = evictions_;
    for (const auto& e : lru_) {
      if (!s.oldest_entry_ms || e.timestamp_ms < *s.oldest_entry_ms) s.oldest_entry_ms = e.timestamp_ms;
      if (!s.newest_entry_ms || e.timestamp_ms > *s.newest_entry_ms) s.newest_entry_ms = e.timestamp_ms;
    }
    return s;
  }

  void ResetStats() {
    std::lock_guard<std::mutex> lock(mu_);
    hits_ = misses_ = evictions_ = 0;
  }

  uint64_t SizeBytes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return size_bytes_;
  }

  size_t Items() const {
    std::lock_guard<std::mutex> lock(mu_);
    return index_.size();
  }

 private:
  struct Entry {
    K key;
    V value;
    size_t size_bytes;
    uint64_t timestamp_ms;
  };
  using List = std::list<Entry>;
  using Index = std::unordered_map<K, typename List::iterator, Hash>;

  size_t EstimateSize(const V& value) const {
    try {
      return estimator_(value);
    } catch (const std::exception& e) {
      Logger()->warn("cache: size estimation failed ({}), charging {} bytes",
                     e.what(), kFallbackEntryBytes);
      return kFallbackEntryBytes;
    }
  }

  bool IsExpiredLocked(const Entry& e) const {
    if (opt_.ttl_ms == 0) return false;
    const uint64_t now = opt_.clock->NowMillis();
    return now > e.timestamp_ms && now - e.timestamp_ms > opt_.ttl_ms;
  }

  void EraseLocked(typename Index::iterator it) {
    size_bytes_ -= it->second->size_bytes;
    lru_.erase(it->second);
    index_.erase(it);
  }

  void EvictIfNeededLocked() {
    while (!lru_.empty() &&
           ((opt_.max_items > 0 && index_.size() > opt_.max_items) ||
            size_bytes_ > opt_.max_size_bytes)) {
      EraseLocked(index_.find(lru_.back().key));
      ++evictions_;
    }
  }

  template <typename Pred>
  size_t RemoveIf(Pred pred) {
    std::lock_guard<std::mutex> lock(mu_);
    size_t count = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
      auto next = std::next(it);
      if (pred(std::string_view(it->key))) {
        EraseLocked(index_.find(it->key));
        ++count;
      }
      it = next;
    }
    return count;
  }

  CacheOptions opt_;
  SizeEstimator estimator_;

  mutable std::mutex mu_;
  List lru_;
  Index index_;
  uint64_t size_bytes_ = 0;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t evictions_ = 0;
};

}  // namespace sessionvault

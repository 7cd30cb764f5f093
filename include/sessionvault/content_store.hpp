#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

#include <sessionvault/cache.hpp>
#include <sessionvault/clock.hpp>
#include <sessionvault/metrics.hpp>

namespace sessionvault {

class Database;

/** Binary attachment content. Immutable once stored. */
struct Blob {
  std::string data;
  std::string mime_type;

  uint64_t size() const { return data.size(); }
};

/** One owner of a blob. attachment_id defaults to the blob hash. */
struct Reference {
  std::string owner_id;
  std::string attachment_id;
  uint64_t added_at_ms = 0;
};

/**
 * Persisted bookkeeping for one stored blob.
 * ref_count always equals references.size().
 */
struct BlobRecord {
  std::string hash;
  uint64_t size = 0;
  std::string mime_type;
  uint64_t created_at_ms = 0;
  uint64_t last_accessed_at_ms = 0;
  std::vector<Reference> references;
  uint64_t ref_count = 0;

  Json::Value ToJson() const;
  static bool FromJson(const Json::Value& v, BlobRecord* out);

  std::string Serialize() const;
  static bool Deserialize(std::string_view data, BlobRecord* out);
};

struct GcProgress {
  uint64_t current = 0;
  uint64_t total = 0;
  std::string status;
  double percentage = 0.0;
};

using GcProgressCallback = std::function<void(const GcProgress&)>;

struct GcResult {
  uint64_t deleted = 0;
  uint64_t freed_bytes = 0;
  std::vector<std::string> errors;  // "<hash>: <status>"
  uint64_t duration_ms = 0;
};

struct ContentStats {
  uint64_t total_blobs = 0;
  uint64_t total_bytes = 0;
  uint64_t total_references = 0;
  uint64_t dedup_savings_bytes = 0;
  double average_references_per_blob = 0.0;
};

struct ContentStoreOptions {
  // Transaction behavior
  int lock_timeout_ms = 2000;
  int max_retries = 16;

  // In-memory BlobRecord cache
  uint64_t metadata_cache_bytes = 8ull * 1024ull * 1024ull;

  // Report GC progress every N records (and always on the last one).
  uint64_t gc_progress_interval = 100;

  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Clock> clock;
};

/**
 * sessionvault::ContentStore
 *
 * Content-addressable blob store. Each blob is keyed by the lowercase hex
 * SHA-256 of its bytes and stored once; owners are tracked as references and
 * unreferenced blobs are reclaimed by CollectGarbage().
 *
 * Every BlobRecord read-modify-write runs in a pessimistic transaction that
 * locks the record with GetForUpdate, so mutations of one hash are serialized
 * while different hashes proceed in parallel.
 *
 * Two different byte sequences are assumed never to share a SHA-256 digest.
 * Save() only checks that an existing record has the same length.
 */
class ContentStore {
 public:
  /** The Database must outlive the store. */
  explicit ContentStore(Database* db, ContentStoreOptions opt = ContentStoreOptions{});

  ContentStore(const ContentStore&) = delete;
  ContentStore& operator=(const ContentStore&) = delete;

  /** Store blob bytes unless already present; the content hash is returned either way. */
  rocksdb::Status Save(const Blob& blob, std::string* hash);
  rocksdb::Status Save(std::string_view data, std::string_view mime_type, std::string* hash);

  /** NotFound for an unknown hash. */
  rocksdb::Status Load(std::string_view hash, Blob* blob);

  /** Deletes only unreferenced blobs. A refusal is OK with *deleted == false. */
  rocksdb::Status Delete(std::string_view hash, bool* deleted);

  rocksdb::Status Exists(std::string_view hash, bool* exists);

  /** NotFound if the blob does not exist. A duplicate (owner, attachment) pair is a no-op. */
  rocksdb::Status AddReference(std::string_view hash,
                               std::string_view owner_id,
                               std::string_view attachment_id = {});

  /**
   * Removes every reference held by owner_id, or only (owner_id, attachment_id)
   * when an attachment id is given. The blob is kept even at zero references.
   */
  rocksdb::Status RemoveReference(std::string_view hash,
                                  std::string_view owner_id,
                                  std::string_view attachment_id = {});

  /** 0 for an unknown hash. */
  rocksdb::Status ReferenceCount(std::string_view hash, uint64_t* count);
  rocksdb::Status References(std::string_view hash, std::vector<Reference>* refs);

  rocksdb::Status CollectGarbage(GcResult* result, const GcProgressCallback& on_progress = {});

  rocksdb::Status Stats(ContentStats* stats);

  rocksdb::Status ListHashes(std::vector<std::string>* hashes);
  rocksdb::Status GetRecord(std::string_view hash, BlobRecord* record);

  /** Re-hash the stored bytes and compare with the content address. */
  rocksdb::Status Verify(std::string_view hash, bool* ok);

  CacheStats MetadataCacheStats() const { return record_cache_.GetStats(); }
  void ClearMetadataCache() { record_cache_.Clear(); }

 private:
  enum class RecordAction { kNone, kWrite, kErase };
  using RecordMutator = std::function<RecordAction(BlobRecord*)>;

  // Lock the record, apply mutate and commit, retrying retryable conflicts.
  // NotFound if the record does not exist. *out receives the record as seen
  // by the mutator after it ran.
  rocksdb::Status MutateRecord(std::string_view hash,
                               std::string_view op,
                               const RecordMutator& mutate,
                               BlobRecord* out);

  rocksdb::Status ReadRecord(std::string_view hash, BlobRecord* record);
  void InvalidateRecord(std::string_view hash);

  rocksdb::TransactionOptions TxnOptions() const;

  Database* db_;
  ContentStoreOptions opt_;

  // Held across record-cache fills and across commit plus cache update, so a
  // stale read never lands in the cache after a newer commit.
  std::mutex cache_fill_mu_;
  Cache<std::string, BlobRecord> record_cache_;
};

}  // namespace sessionvault

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <rocksdb/status.h>

#include <sessionvault/backend.hpp>
#include <sessionvault/cache.hpp>
#include <sessionvault/clock.hpp>
#include <sessionvault/content_store.hpp>
#include <sessionvault/metrics.hpp>
#include <sessionvault/records.hpp>
#include <sessionvault/write_queue.hpp>

namespace sessionvault {

struct RecordStoreOptions {
  // Hot-record cache. ttl_ms defaults to five minutes.
  CacheOptions cache{100ull * 1024ull * 1024ull, 0, 5 * 60 * 1000, nullptr};

  // Items per chunk by chunk type; other types use default_items_per_chunk.
  std::map<std::string, uint64_t> items_per_chunk = {{kScreenshots, 20}};
  uint64_t default_items_per_chunk = 100;

  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Clock> clock;
};

/**
 * sessionvault::RecordStore
 *
 * Splits each record into small metadata, numbered chunks of items per chunk
 * type, and named large objects, and persists each part under its own key.
 *
 * Every mutation follows the same order: invalidate the cache entry, apply
 * the logical update, repopulate the cache, enqueue the durable write. Reads
 * consult the cache, then writes still waiting in the queue, then the
 * backend, so a value is readable as soon as its save returns.
 *
 * Attachment bytes go to the ContentStore; chunk items carry only the hash,
 * and the record holds one reference per (record, item) pair.
 *
 * Mutations of one record are serialized; different records proceed in
 * parallel.
 */
class RecordStore {
 public:
  /** backend, queue and content must outlive the store. */
  RecordStore(Backend* backend, WriteQueue* queue, ContentStore* content,
              RecordStoreOptions opt = RecordStoreOptions{});

  RecordStore(const RecordStore&) = delete;
  RecordStore& operator=(const RecordStore&) = delete;

  // ---------------------------------------------------------------------------
  // Metadata
  // ---------------------------------------------------------------------------

  /** Stamps updated_at_ms and storage_version (and created_at_ms when unset),
   *  then caches and enqueues. Use Priority::kCritical for lifecycle changes. */
  rocksdb::Status SaveMetadata(const RecordMetadata& metadata,
                               Priority priority = Priority::kNormal);

  rocksdb::Status LoadMetadata(std::string_view id, RecordMetadata* metadata);

  rocksdb::Status ListRecordIds(std::vector<std::string>* ids);
  rocksdb::Status ListAllMetadata(std::vector<RecordMetadata>* out);

  /** True when the record exists and uses the current storage layout. */
  rocksdb::Status IsChunked(std::string_view id, bool* chunked);

  // ---------------------------------------------------------------------------
  // Whole records
  // ---------------------------------------------------------------------------

  /**
   * Assemble metadata, the items of every chunk type in the manifest and every
   * large object the metadata lists. A listed object that was never written is
   * left out. NotFound if the record has no metadata.
   */
  rocksdb::Status LoadFullRecord(std::string_view id, FullRecord* record);

  /**
   * Replace a record with record: items are split into chunks, the manifest
   * and large-object list are rebuilt from record.items and
   * record.large_objects, and parts the previous version had beyond those are
   * deleted. Every attachment hash in the items gains a reference from
   * (id, item id); an unknown hash fails the call before anything is written.
   */
  rocksdb::Status SaveFullRecord(const FullRecord& record, Priority priority = Priority::kNormal);

  // ---------------------------------------------------------------------------
  // Chunks
  // ---------------------------------------------------------------------------

  rocksdb::Status SaveChunk(std::string_view id, std::string_view type, uint64_t index,
                            const Chunk& chunk, Priority priority = Priority::kNormal);

  /** A chunk that was never written loads as an empty chunk. */
  rocksdb::Status LoadChunk(std::string_view id, std::string_view type, uint64_t index,
                            Chunk* chunk);

  /** Replace all items of a type, splitting them into chunks and updating the manifest. */
  rocksdb::Status SaveItems(std::string_view id, std::string_view type,
                            const std::vector<ChunkItem>& items,
                            Priority priority = Priority::kNormal);

  /** NotFound if the record has no metadata. */
  rocksdb::Status AppendItem(std::string_view id, std::string_view type, const ChunkItem& item,
                             Priority priority = Priority::kNormal);

  rocksdb::Status LoadAllItems(std::string_view id, std::string_view type,
                               std::vector<ChunkItem>* items);

  uint64_t ItemsPerChunk(std::string_view type) const;

  // ---------------------------------------------------------------------------
  // Large objects (summary, transcription, ...)
  // ---------------------------------------------------------------------------

  rocksdb::Status SaveLargeObject(std::string_view id, std::string_view name,
                                  const Json::Value& value,
                                  Priority priority = Priority::kNormal);
  rocksdb::Status LoadLargeObject(std::string_view id, std::string_view name, Json::Value* value);

  // ---------------------------------------------------------------------------
  // Attachments
  // ---------------------------------------------------------------------------

  /**
   * Store blob in the ContentStore, reference it from (id, item_id) and point
   * the chunk item at it, creating the item when absent. A different hash the
   * item pointed at before is released.
   */
  rocksdb::Status SaveAttachment(std::string_view id, std::string_view type,
                                 uint64_t chunk_index, std::string_view item_id,
                                 const Blob& blob, std::string* hash);

  rocksdb::Status LoadAttachment(std::string_view hash, Blob* blob);

  // ---------------------------------------------------------------------------
  // Lifecycle & cache
  // ---------------------------------------------------------------------------

  /** Release attachment references and delete every part of the record.
   *  An unknown record is a no-op. */
  rocksdb::Status DeleteRecord(std::string_view id);

  size_t ClearRecordCache(std::string_view id);
  void ClearCache();
  void PruneCache();
  void SetCacheSize(uint64_t max_size_bytes);
  CacheStats GetCacheStats() const;
  void ResetCacheStats();

 private:
  static constexpr size_t kStripes = 16;

  std::mutex& RecordLock(std::string_view id);

  // cache -> pending queue write -> backend. Empty cache_key skips the cache.
  rocksdb::Status ReadJson(const std::string& backend_key, const std::string& cache_key,
                           Json::Value* out);
  void WriteJson(const std::string& backend_key, const std::string& cache_key,
                 const Json::Value& value, Priority priority);

  rocksdb::Status SaveMetadataLocked(RecordMetadata metadata, Priority priority);
  rocksdb::Status SaveChunkLocked(std::string_view id, std::string_view type, uint64_t index,
                                  const Chunk& chunk, Priority priority);
  rocksdb::Status LoadItemsFromManifest(std::string_view id, std::string_view type,
                                        const ChunkManifest& manifest,
                                        std::vector<ChunkItem>* items);
  rocksdb::Status AddToIndex(const std::string& id);
  rocksdb::Status RemoveFromIndex(const std::string& id);
  rocksdb::Status LoadIndexLocked();

  Backend* backend_;
  WriteQueue* queue_;
  ContentStore* content_;
  RecordStoreOptions opt_;

  Cache<std::string, Json::Value> cache_;
  std::array<std::mutex, kStripes> record_mu_;

  std::mutex index_mu_;
  std::optional<std::vector<std::string>> index_;
};

}  // namespace sessionvault

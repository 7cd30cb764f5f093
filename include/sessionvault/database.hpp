#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>
#include <rocksdb/statistics.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

#include <sessionvault/metrics.hpp>

namespace sessionvault {

/**
 * Options for the on-disk database shared by ContentStore and RocksBackend.
 */
struct DatabaseOptions {
  // RocksDB performance knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Sync the WAL on every write. Off by default; the write queue already
  // trails the in-memory state.
  bool sync_writes = false;

  std::shared_ptr<MetricsSink> metrics;
};

/**
 * sessionvault::Database
 *
 * Owns a RocksDB TransactionDB and the column families used by the engine:
 * - sv_records    record metadata, chunks and large objects (RocksBackend)
 * - sv_blob_data  raw blob bytes keyed by {hash-prefix}/{hash}
 * - sv_blob_meta  BlobRecord JSON keyed by {hash-prefix}/{hash}
 *
 * Pessimistic transactions on this database provide the per-key
 * single-writer discipline for BlobRecord read-modify-write.
 */
class Database {
 public:
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  /** Open or create a database at db_path, creating missing column families. */
  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<Database>* out,
                              const DatabaseOptions& opt = DatabaseOptions{});

  /** Close and release RocksDB resources. Safe to call multiple times. */
  void Close();

  bool IsOpen() const { return db_ != nullptr; }

  rocksdb::TransactionDB* db() const { return db_; }
  rocksdb::ColumnFamilyHandle* records_cf() const { return records_cf_; }
  rocksdb::ColumnFamilyHandle* blob_data_cf() const { return blob_data_cf_; }
  rocksdb::ColumnFamilyHandle* blob_meta_cf() const { return blob_meta_cf_; }

  rocksdb::WriteOptions write_options() const;

  /** Emit block cache usage and hit/miss deltas to the metrics sink.
   *  Metrics emitted:
   *   - sessionvault.db.block_cache.hit_total (counter delta since last call)
   *   - sessionvault.db.block_cache.miss_total (counter delta since last call)
   *   - sessionvault.db.block_cache.fill_ratio (gauge, 0.0-1.0)
   *   - sessionvault.db.block_cache.usage_bytes (gauge)
   */
  void EmitCacheMetrics();

 private:
  explicit Database(const DatabaseOptions& opt);

  DatabaseOptions opt_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;

  std::shared_ptr<rocksdb::Cache> block_cache_;
  std::shared_ptr<rocksdb::Statistics> statistics_;
  uint64_t last_cache_hits_ = 0;
  uint64_t last_cache_misses_ = 0;

  rocksdb::ColumnFamilyHandle* records_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* blob_data_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* blob_meta_cf_ = nullptr;
};

}  // namespace sessionvault

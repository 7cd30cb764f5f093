#include <sessionvault/database.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>

#include <sessionvault/logging.hpp>

namespace sessionvault {

namespace {

constexpr const char* kRecordsCF  = "sv_records";
constexpr const char* kBlobDataCF = "sv_blob_data";
constexpr const char* kBlobMetaCF = "sv_blob_meta";

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

}  // namespace

Database::Database(const DatabaseOptions& opt) : opt_(opt) {}

Database::~Database() { Close(); }

rocksdb::Status Database::Open(const std::string& db_path,
                               std::unique_ptr<Database>* out,
                               const DatabaseOptions& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  auto database = std::unique_ptr<Database>(new Database(opt));

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  auto statistics = rocksdb::CreateDBStatistics();
  options.statistics = statistics;

  rocksdb::TransactionDBOptions txn_opts;

  // Shared cache for all CFs
  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  database->block_cache_ = cache;
  database->statistics_ = statistics;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kRecordsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kBlobDataCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kBlobMetaCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    Logger()->error("database: open {} failed: {}", db_path, s.ToString());
    return s;
  }

  database->db_ = db;
  database->handles_ = std::move(handles);

  // Descriptor order = handle order
  database->records_cf_   = database->handles_[1];
  database->blob_data_cf_ = database->handles_[2];
  database->blob_meta_cf_ = database->handles_[3];

  Logger()->debug("database: opened {}", db_path);
  *out = std::move(database);
  return rocksdb::Status::OK();
}

rocksdb::WriteOptions Database::write_options() const {
  rocksdb::WriteOptions wo;
  wo.sync = opt_.sync_writes;
  return wo;
}

void Database::EmitCacheMetrics() {
  if (!opt_.metrics) return;

  if (block_cache_) {
    size_t usage = block_cache_->GetUsage();
    size_t capacity = block_cache_->GetCapacity();
    double fill_ratio = capacity > 0 ? static_cast<double>(usage) / capacity : 0.0;

    internal::EmitGauge(opt_.metrics, "sessionvault.db.block_cache.fill_ratio", fill_ratio);
    internal::EmitGauge(opt_.metrics, "sessionvault.db.block_cache.usage_bytes",
                        static_cast<double>(usage));
  }

  if (statistics_) {
    uint64_t hits = statistics_->getTickerCount(rocksdb::BLOCK_CACHE_HIT);
    uint64_t misses = statistics_->getTickerCount(rocksdb::BLOCK_CACHE_MISS);

    // Emit deltas since last call
    if (hits >= last_cache_hits_) {
      internal::EmitCounter(opt_.metrics, "sessionvault.db.block_cache.hit_total",
                            hits - last_cache_hits_);
    }
    if (misses >= last_cache_misses_) {
      internal::EmitCounter(opt_.metrics, "sessionvault.db.block_cache.miss_total",
                            misses - last_cache_misses_);
    }

    last_cache_hits_ = hits;
    last_cache_misses_ = misses;
  }
}

void Database::Close() {
  if (!db_) return;

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  records_cf_ = blob_data_cf_ = blob_meta_cf_ = nullptr;
}

}  // namespace sessionvault

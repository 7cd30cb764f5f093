#include <sessionvault/content_store.hpp>

#include <algorithm>

#include <rocksdb/iterator.h>

#include <sessionvault/database.hpp>
#include <sessionvault/internal.hpp>
#include <sessionvault/logging.hpp>

namespace sessionvault {

namespace {

using internal::EmitCounter;
using internal::EmitHistogram;

size_t EstimateRecordBytes(const BlobRecord& r) {
  size_t n = 64 + r.hash.size() + r.mime_type.size();
  for (const auto& ref : r.references) {
    n += 16 + ref.owner_id.size() + ref.attachment_id.size();
  }
  return n;
}

CacheOptions RecordCacheOptions(const ContentStoreOptions& opt) {
  CacheOptions co;
  co.max_size_bytes = opt.metadata_cache_bytes;
  co.clock = opt.clock;
  return co;
}

}  // namespace

// ---------------------------------------------------------------------------
// BlobRecord
// ---------------------------------------------------------------------------

Json::Value BlobRecord::ToJson() const {
  Json::Value v(Json::objectValue);
  v["hash"] = hash;
  v["size"] = Json::UInt64(size);
  v["mime_type"] = mime_type;
  v["created_at_ms"] = Json::UInt64(created_at_ms);
  v["last_accessed_at_ms"] = Json::UInt64(last_accessed_at_ms);

  Json::Value refs(Json::arrayValue);
  for (const auto& r : references) {
    Json::Value jr(Json::objectValue);
    jr["owner_id"] = r.owner_id;
    jr["attachment_id"] = r.attachment_id;
    jr["added_at_ms"] = Json::UInt64(r.added_at_ms);
    refs.append(jr);
  }
  v["references"] = refs;
  v["ref_count"] = Json::UInt64(ref_count);
  return v;
}

bool BlobRecord::FromJson(const Json::Value& v, BlobRecord* out) {
  if (!out || !v.isObject()) return false;
  if (!v["hash"].isString() || !v["size"].isUInt64()) return false;

  BlobRecord r;
  r.hash = v["hash"].asString();
  r.size = v["size"].asUInt64();
  r.mime_type = v.get("mime_type", "").asString();
  r.created_at_ms = v.get("created_at_ms", Json::UInt64(0)).asUInt64();
  r.last_accessed_at_ms = v.get("last_accessed_at_ms", Json::UInt64(0)).asUInt64();

  const Json::Value& refs = v["references"];
  if (refs.isArray()) {
    for (const auto& jr : refs) {
      Reference ref;
      ref.owner_id = jr.get("owner_id", "").asString();
      ref.attachment_id = jr.get("attachment_id", "").asString();
      ref.added_at_ms = jr.get("added_at_ms", Json::UInt64(0)).asUInt64();
      r.references.push_back(std::move(ref));
    }
  }
  // ref_count is derived; a stored value that disagrees is ignored.
  r.ref_count = r.references.size();
  *out = std::move(r);
  return true;
}

std::string BlobRecord::Serialize() const { return internal::WriteJson(ToJson()); }

bool BlobRecord::Deserialize(std::string_view data, BlobRecord* out) {
  Json::Value v;
  if (!internal::ParseJson(data, &v)) return false;
  return FromJson(v, out);
}

// ---------------------------------------------------------------------------
// ContentStore
// ---------------------------------------------------------------------------

ContentStore::ContentStore(Database* db, ContentStoreOptions opt)
    : db_(db),
      opt_(std::move(opt)),
      record_cache_(RecordCacheOptions(opt_), EstimateRecordBytes) {
  if (!opt_.clock) opt_.clock = DefaultClock();
  if (opt_.gc_progress_interval == 0) opt_.gc_progress_interval = 1;
}

rocksdb::TransactionOptions ContentStore::TxnOptions() const {
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;
  return to;
}

rocksdb::Status ContentStore::Save(std::string_view data, std::string_view mime_type,
                                   std::string* hash) {
  Blob blob;
  blob.data.assign(data.data(), data.size());
  blob.mime_type.assign(mime_type.data(), mime_type.size());
  return Save(blob, hash);
}

rocksdb::Status ContentStore::Save(const Blob& blob, std::string* hash) {
  if (!hash) return rocksdb::Status::InvalidArgument("hash is null");
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  if (blob.data.empty()) return rocksdb::Status::InvalidArgument("empty blob");

  const uint64_t op_start_us = internal::NowMicros();
  EmitCounter(opt_.metrics, "sessionvault.content.save.calls", 1);

  const std::string digest = internal::Sha256::HexDigest(blob.data);
  const std::string key = internal::BlobKey(digest);

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    EmitHistogram(opt_.metrics, "sessionvault.content.save.latency_us",
                  internal::NowMicros() - op_start_us);
    if (st.ok()) {
      *hash = digest;
    } else {
      EmitCounter(opt_.metrics, "sessionvault.content.save.error_total", 1);
    }
    return st;
  };

  rocksdb::ReadOptions ro;
  for (int attempt = 0; attempt < opt_.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(
        db_->db()->BeginTransaction(db_->write_options(), TxnOptions()));
    if (!txn) return finish(rocksdb::Status::IOError("BeginTransaction returned null"));

    std::string raw;
    rocksdb::Status s = txn->GetForUpdate(ro, db_->blob_meta_cf(), rocksdb::Slice(key), &raw);

    if (s.ok()) {
      txn->Rollback();
      BlobRecord existing;
      if (!BlobRecord::Deserialize(raw, &existing)) {
        return finish(rocksdb::Status::Corruption("unreadable blob record", digest));
      }
      if (existing.size != blob.size()) {
        Logger()->error("content: hash {} already stored with size {}, new blob has size {}",
                        digest, existing.size, blob.size());
        return finish(rocksdb::Status::Corruption("size mismatch for existing hash", digest));
      }
      EmitCounter(opt_.metrics, "sessionvault.content.save.dedup_hit_total", 1);
      Logger()->debug("content: dedup hit {} ({} bytes)", internal::ShortHash(digest), blob.size());
      return finish(rocksdb::Status::OK());
    }

    if (!s.IsNotFound()) {
      if (internal::IsRetryableTxnStatus(s)) {
        EmitCounter(opt_.metrics, "sessionvault.content.save.retry_total", 1);
        continue;
      }
      return finish(s);
    }

    const uint64_t now = opt_.clock->NowMillis();
    BlobRecord record;
    record.hash = digest;
    record.size = blob.size();
    record.mime_type = blob.mime_type;
    record.created_at_ms = now;
    record.last_accessed_at_ms = now;

    s = txn->Put(db_->blob_data_cf(), rocksdb::Slice(key), rocksdb::Slice(blob.data));
    if (!s.ok()) return finish(s);
    s = txn->Put(db_->blob_meta_cf(), rocksdb::Slice(key), rocksdb::Slice(record.Serialize()));
    if (!s.ok()) return finish(s);

    rocksdb::Status cs = txn->Commit();
    if (cs.ok()) {
      EmitCounter(opt_.metrics, "sessionvault.content.save.created_total", 1);
      EmitHistogram(opt_.metrics, "sessionvault.content.save.bytes", blob.size());
      Logger()->debug("content: stored {} ({} bytes, {})", internal::ShortHash(digest),
                      blob.size(), blob.mime_type);
      InvalidateRecord(digest);
      return finish(cs);
    }
    if (internal::IsRetryableTxnStatus(cs)) {
      EmitCounter(opt_.metrics, "sessionvault.content.save.retry_total", 1);
      continue;
    }
    return finish(cs);
  }

  return finish(rocksdb::Status::TimedOut("Save exceeded max_retries"));
}

rocksdb::Status ContentStore::Load(std::string_view hash, Blob* blob) {
  if (!blob) return rocksdb::Status::InvalidArgument("blob is null");
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  if (!internal::IsValidHash(hash)) return rocksdb::Status::InvalidArgument("malformed hash");

  const uint64_t op_start_us = internal::NowMicros();
  const std::string key = internal::BlobKey(hash);

  BlobRecord record;
  rocksdb::Status s = ReadRecord(hash, &record);
  if (s.IsNotFound()) {
    EmitCounter(opt_.metrics, "sessionvault.content.load.miss_total", 1);
    return s;
  }
  if (!s.ok()) return s;

  std::string data;
  s = db_->db()->Get(rocksdb::ReadOptions(), db_->blob_data_cf(), rocksdb::Slice(key), &data);
  if (s.IsNotFound()) {
    Logger()->error("content: record for {} has no data", hash);
    return rocksdb::Status::Corruption("blob data missing", std::string(hash));
  }
  if (!s.ok()) return s;

  blob->data = std::move(data);
  blob->mime_type = record.mime_type;

  // Access time is advisory; a failed update does not fail the read.
  const uint64_t now = opt_.clock->NowMillis();
  BlobRecord touched;
  rocksdb::Status ts = MutateRecord(
      hash, "touch",
      [now](BlobRecord* r) {
        r->last_accessed_at_ms = now;
        return RecordAction::kWrite;
      },
      &touched);
  if (!ts.ok()) {
    Logger()->debug("content: access time update for {} failed: {}",
                    internal::ShortHash(hash), ts.ToString());
  }

  EmitCounter(opt_.metrics, "sessionvault.content.load.hit_total", 1);
  EmitHistogram(opt_.metrics, "sessionvault.content.load.latency_us",
                internal::NowMicros() - op_start_us);
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::Delete(std::string_view hash, bool* deleted) {
  if (!deleted) return rocksdb::Status::InvalidArgument("deleted is null");
  *deleted = false;
  if (!internal::IsValidHash(hash)) return rocksdb::Status::InvalidArgument("malformed hash");

  uint64_t refs = 0;
  BlobRecord after;
  rocksdb::Status s = MutateRecord(
      hash, "delete",
      [&refs](BlobRecord* r) {
        refs = r->ref_count;
        return r->ref_count == 0 ? RecordAction::kErase : RecordAction::kNone;
      },
      &after);

  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;

  if (refs > 0) {
    Logger()->warn("content: refusing to delete {} with {} reference(s)",
                   internal::ShortHash(hash), refs);
    EmitCounter(opt_.metrics, "sessionvault.content.delete.refused_total", 1);
    return rocksdb::Status::OK();
  }

  *deleted = true;
  EmitCounter(opt_.metrics, "sessionvault.content.delete.ok_total", 1);
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::Exists(std::string_view hash, bool* exists) {
  if (!exists) return rocksdb::Status::InvalidArgument("exists is null");
  *exists = false;
  if (!internal::IsValidHash(hash)) return rocksdb::Status::OK();

  BlobRecord record;
  rocksdb::Status s = ReadRecord(hash, &record);
  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;
  *exists = true;
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::AddReference(std::string_view hash,
                                           std::string_view owner_id,
                                           std::string_view attachment_id) {
  if (!internal::IsValidHash(hash)) return rocksdb::Status::InvalidArgument("malformed hash");
  if (owner_id.empty()) return rocksdb::Status::InvalidArgument("empty owner id");

  const std::string owner(owner_id);
  const std::string attachment = attachment_id.empty() ? std::string(hash)
                                                       : std::string(attachment_id);
  const uint64_t now = opt_.clock->NowMillis();

  bool duplicate = false;
  BlobRecord after;
  rocksdb::Status s = MutateRecord(
      hash, "add_reference",
      [&](BlobRecord* r) {
        for (const auto& ref : r->references) {
          if (ref.owner_id == owner && ref.attachment_id == attachment) {
            duplicate = true;
            return RecordAction::kNone;
          }
        }
        r->references.push_back(Reference{owner, attachment, now});
        r->ref_count = r->references.size();
        return RecordAction::kWrite;
      },
      &after);

  if (s.IsNotFound()) {
    Logger()->warn("content: cannot reference unknown blob {} (owner {})",
                   internal::ShortHash(hash), owner);
    return s;
  }
  if (!s.ok()) return s;

  if (duplicate) {
    Logger()->debug("content: {} already references {} as {}", owner,
                    internal::ShortHash(hash), attachment);
    return rocksdb::Status::OK();
  }
  EmitCounter(opt_.metrics, "sessionvault.content.reference.added_total", 1);
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::RemoveReference(std::string_view hash,
                                              std::string_view owner_id,
                                              std::string_view attachment_id) {
  if (!internal::IsValidHash(hash)) return rocksdb::Status::InvalidArgument("malformed hash");

  size_t removed = 0;
  BlobRecord after;
  rocksdb::Status s = MutateRecord(
      hash, "remove_reference",
      [&](BlobRecord* r) {
        const size_t before = r->references.size();
        r->references.erase(
            std::remove_if(r->references.begin(), r->references.end(),
                           [&](const Reference& ref) {
                             if (ref.owner_id != owner_id) return false;
                             return attachment_id.empty() || ref.attachment_id == attachment_id;
                           }),
            r->references.end());
        removed = before - r->references.size();
        r->ref_count = r->references.size();
        return removed > 0 ? RecordAction::kWrite : RecordAction::kNone;
      },
      &after);

  if (s.IsNotFound()) {
    Logger()->warn("content: cannot release unknown blob {} (owner {})",
                   internal::ShortHash(hash), owner_id);
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;

  if (removed == 0) {
    Logger()->warn("content: {} holds no reference to {}", owner_id, internal::ShortHash(hash));
    return rocksdb::Status::OK();
  }
  EmitCounter(opt_.metrics, "sessionvault.content.reference.removed_total", removed);
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::ReferenceCount(std::string_view hash, uint64_t* count) {
  if (!count) return rocksdb::Status::InvalidArgument("count is null");
  *count = 0;
  if (!internal::IsValidHash(hash)) return rocksdb::Status::OK();

  BlobRecord record;
  rocksdb::Status s = ReadRecord(hash, &record);
  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;
  *count = record.ref_count;
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::References(std::string_view hash, std::vector<Reference>* refs) {
  if (!refs) return rocksdb::Status::InvalidArgument("refs is null");
  refs->clear();
  if (!internal::IsValidHash(hash)) return rocksdb::Status::OK();

  BlobRecord record;
  rocksdb::Status s = ReadRecord(hash, &record);
  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;
  *refs = std::move(record.references);
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::GetRecord(std::string_view hash, BlobRecord* record) {
  if (!record) return rocksdb::Status::InvalidArgument("record is null");
  if (!internal::IsValidHash(hash)) return rocksdb::Status::InvalidArgument("malformed hash");
  return ReadRecord(hash, record);
}

rocksdb::Status ContentStore::ListHashes(std::vector<std::string>* hashes) {
  if (!hashes) return rocksdb::Status::InvalidArgument("hashes is null");
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  hashes->clear();

  std::unique_ptr<rocksdb::Iterator> it(
      db_->db()->NewIterator(rocksdb::ReadOptions(), db_->blob_meta_cf()));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    // Key layout: "ab/<hash>"
    rocksdb::Slice k = it->key();
    if (k.size() < 3) continue;
    hashes->emplace_back(k.data() + 3, k.size() - 3);
  }
  return it->status();
}

rocksdb::Status ContentStore::CollectGarbage(GcResult* result,
                                             const GcProgressCallback& on_progress) {
  if (!result) return rocksdb::Status::InvalidArgument("result is null");
  *result = GcResult{};

  const uint64_t start_ms = opt_.clock->NowMillis();
  const uint64_t op_start_us = internal::NowMicros();

  std::vector<std::string> hashes;
  rocksdb::Status s = ListHashes(&hashes);
  if (!s.ok()) return s;

  const uint64_t total = hashes.size();
  Logger()->info("content: garbage collection started ({} blobs)", total);

  for (uint64_t i = 0; i < total; ++i) {
    const std::string& hash = hashes[i];

    uint64_t freed = 0;
    bool erased = false;
    BlobRecord after;
    rocksdb::Status ds = MutateRecord(
        hash, "gc",
        [&](BlobRecord* r) {
          if (r->ref_count != 0) return RecordAction::kNone;
          freed = r->size;
          erased = true;
          return RecordAction::kErase;
        },
        &after);

    if (ds.ok()) {
      if (erased) {
        ++result->deleted;
        result->freed_bytes += freed;
      }
    } else if (!ds.IsNotFound()) {
      Logger()->error("content: gc of {} failed: {}", hash, ds.ToString());
      result->errors.push_back(hash + ": " + ds.ToString());
    }

    if (on_progress && ((i + 1) % opt_.gc_progress_interval == 0 || i + 1 == total)) {
      GcProgress p;
      p.current = i + 1;
      p.total = total;
      p.status = "Scanning " + std::string(internal::ShortHash(hash)) + "...";
      p.percentage = static_cast<double>(i + 1) * 100.0 / static_cast<double>(total);
      on_progress(p);
    }
  }

  const uint64_t end_ms = opt_.clock->NowMillis();
  result->duration_ms = end_ms > start_ms ? end_ms - start_ms : 0;

  EmitCounter(opt_.metrics, "sessionvault.content.gc.deleted_total", result->deleted);
  EmitCounter(opt_.metrics, "sessionvault.content.gc.freed_bytes_total", result->freed_bytes);
  EmitHistogram(opt_.metrics, "sessionvault.content.gc.latency_us",
                internal::NowMicros() - op_start_us);

  Logger()->info("content: garbage collection deleted {} blob(s), freed {} bytes, {} error(s)",
                 result->deleted, result->freed_bytes, result->errors.size());
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::Stats(ContentStats* stats) {
  if (!stats) return rocksdb::Status::InvalidArgument("stats is null");
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  *stats = ContentStats{};

  std::unique_ptr<rocksdb::Iterator> it(
      db_->db()->NewIterator(rocksdb::ReadOptions(), db_->blob_meta_cf()));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    BlobRecord r;
    if (!BlobRecord::Deserialize(it->value().ToString(), &r)) {
      Logger()->warn("content: skipping unreadable record {}", it->key().ToString());
      continue;
    }
    ++stats->total_blobs;
    stats->total_bytes += r.size;
    stats->total_references += r.ref_count;
  }
  if (!it->status().ok()) return it->status();

  if (stats->total_blobs > 0) {
    const double avg_size =
        static_cast<double>(stats->total_bytes) / static_cast<double>(stats->total_blobs);
    const double would_be = static_cast<double>(stats->total_references) * avg_size;
    const double savings = would_be - static_cast<double>(stats->total_bytes);
    stats->dedup_savings_bytes = savings > 0 ? static_cast<uint64_t>(savings) : 0;
    stats->average_references_per_blob =
        static_cast<double>(stats->total_references) / static_cast<double>(stats->total_blobs);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status ContentStore::Verify(std::string_view hash, bool* ok) {
  if (!ok) return rocksdb::Status::InvalidArgument("ok is null");
  *ok = false;
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  if (!internal::IsValidHash(hash)) return rocksdb::Status::InvalidArgument("malformed hash");

  std::string data;
  rocksdb::Status s = db_->db()->Get(rocksdb::ReadOptions(), db_->blob_data_cf(),
                                     rocksdb::Slice(internal::BlobKey(hash)), &data);
  if (!s.ok()) return s;

  *ok = internal::Sha256::HexDigest(data) == hash;
  if (!*ok) {
    Logger()->error("content: integrity check failed for {}", hash);
    EmitCounter(opt_.metrics, "sessionvault.content.verify.mismatch_total", 1);
  }
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

rocksdb::Status ContentStore::ReadRecord(std::string_view hash, BlobRecord* record) {
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  const std::string h(hash);

  if (auto cached = record_cache_.Get(h)) {
    *record = std::move(*cached);
    return rocksdb::Status::OK();
  }

  std::lock_guard<std::mutex> lock(cache_fill_mu_);
  std::string raw;
  rocksdb::Status s = db_->db()->Get(rocksdb::ReadOptions(), db_->blob_meta_cf(),
                                     rocksdb::Slice(internal::BlobKey(hash)), &raw);
  if (!s.ok()) return s;

  if (!BlobRecord::Deserialize(raw, record)) {
    return rocksdb::Status::Corruption("unreadable blob record", h);
  }
  record_cache_.Set(h, *record);
  return rocksdb::Status::OK();
}

void ContentStore::InvalidateRecord(std::string_view hash) {
  std::lock_guard<std::mutex> lock(cache_fill_mu_);
  record_cache_.Delete(std::string(hash));
}

rocksdb::Status ContentStore::MutateRecord(std::string_view hash,
                                           std::string_view op,
                                           const RecordMutator& mutate,
                                           BlobRecord* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");

  const std::string key = internal::BlobKey(hash);
  rocksdb::ReadOptions ro;

  for (int attempt = 0; attempt < opt_.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(
        db_->db()->BeginTransaction(db_->write_options(), TxnOptions()));
    if (!txn) return rocksdb::Status::IOError("BeginTransaction returned null");

    std::string raw;
    rocksdb::Status s = txn->GetForUpdate(ro, db_->blob_meta_cf(), rocksdb::Slice(key), &raw);
    if (s.IsNotFound()) return s;
    if (!s.ok()) {
      if (internal::IsRetryableTxnStatus(s)) {
        EmitCounter(opt_.metrics, "sessionvault.content.txn.retry_total", 1);
        continue;
      }
      return s;
    }

    BlobRecord record;
    if (!BlobRecord::Deserialize(raw, &record)) {
      return rocksdb::Status::Corruption("unreadable blob record", std::string(hash));
    }

    const RecordAction action = mutate(&record);
    if (action == RecordAction::kNone) {
      txn->Rollback();
      *out = std::move(record);
      return rocksdb::Status::OK();
    }

    if (action == RecordAction::kWrite) {
      s = txn->Put(db_->blob_meta_cf(), rocksdb::Slice(key), rocksdb::Slice(record.Serialize()));
      if (!s.ok()) return s;
    } else {
      s = txn->Delete(db_->blob_data_cf(), rocksdb::Slice(key));
      if (!s.ok()) return s;
      s = txn->Delete(db_->blob_meta_cf(), rocksdb::Slice(key));
      if (!s.ok()) return s;
    }

    rocksdb::Status cs;
    {
      // Commit and cache update under one lock so cache updates for a hash
      // land in commit order and a concurrent fill cannot resurrect an old record.
      std::lock_guard<std::mutex> lock(cache_fill_mu_);
      cs = txn->Commit();
      if (cs.ok()) {
        if (action == RecordAction::kWrite) {
          record_cache_.Set(std::string(hash), record);
        } else {
          record_cache_.Delete(std::string(hash));
        }
      }
    }
    if (cs.ok()) {
      *out = std::move(record);
      return cs;
    }
    if (internal::IsRetryableTxnStatus(cs)) {
      EmitCounter(opt_.metrics, "sessionvault.content.txn.retry_total", 1);
      continue;
    }
    return cs;
  }

  Logger()->error("content: {} on {} exceeded {} attempts", op, internal::ShortHash(hash),
                  opt_.max_retries);
  return rocksdb::Status::TimedOut("record update exceeded max_retries");
}

}  // namespace sessionvault

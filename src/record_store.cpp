#include <sessionvault/record_store.hpp>

#include <algorithm>
#include <functional>
#include <set>

#include <sessionvault/internal.hpp>
#include <sessionvault/logging.hpp>

namespace sessionvault {

namespace {

using internal::EmitCounter;

// Ids, chunk types and object names become key segments.
bool IsValidSegment(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c == '/' || c == ':') return false;
  }
  return true;
}

uint64_t CeilDiv(uint64_t n, uint64_t d) { return d == 0 ? 0 : (n + d - 1) / d; }

CacheOptions StoreCacheOptions(const RecordStoreOptions& opt) {
  CacheOptions co = opt.cache;
  if (!co.clock) co.clock = opt.clock;
  return co;
}

}  // namespace

RecordStore::RecordStore(Backend* backend, WriteQueue* queue, ContentStore* content,
                         RecordStoreOptions opt)
    : backend_(backend),
      queue_(queue),
      content_(content),
      opt_(std::move(opt)),
      cache_(StoreCacheOptions(opt_), EstimateJsonBytes) {
  if (!opt_.clock) opt_.clock = DefaultClock();
  if (opt_.default_items_per_chunk == 0) opt_.default_items_per_chunk = 1;
}

std::mutex& RecordStore::RecordLock(std::string_view id) {
  return record_mu_[std::hash<std::string_view>{}(id) % kStripes];
}

// ---------------------------------------------------------------------------
// Read / write plumbing
// ---------------------------------------------------------------------------

rocksdb::Status RecordStore::ReadJson(const std::string& backend_key,
                                      const std::string& cache_key,
                                      Json::Value* out) {
  if (!cache_key.empty()) {
    if (auto cached = cache_.Get(cache_key)) {
      *out = std::move(*cached);
      return rocksdb::Status::OK();
    }
  }

  std::string raw;
  switch (queue_->PendingValue(backend_key, &raw)) {
    case PendingState::kDelete:
      return rocksdb::Status::NotFound(backend_key);
    case PendingState::kPut:
      break;
    case PendingState::kNone: {
      rocksdb::Status s = backend_->Get(backend_key, &raw);
      if (!s.ok()) return s;
      break;
    }
  }

  std::string errors;
  if (!internal::ParseJson(raw, out, &errors)) {
    Logger()->error("records: unreadable value at {}: {}", backend_key, errors);
    return rocksdb::Status::Corruption("unreadable JSON", backend_key);
  }
  if (!cache_key.empty()) cache_.Set(cache_key, *out);
  return rocksdb::Status::OK();
}

void RecordStore::WriteJson(const std::string& backend_key, const std::string& cache_key,
                            const Json::Value& value, Priority priority) {
  cache_.Invalidate(cache_key);
  cache_.Set(cache_key, value);
  queue_->Enqueue(backend_key, internal::WriteJson(value), priority);
}

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------

rocksdb::Status RecordStore::SaveMetadata(const RecordMetadata& metadata, Priority priority) {
  if (!IsValidSegment(metadata.id)) return rocksdb::Status::InvalidArgument("invalid record id");
  std::lock_guard<std::mutex> lock(RecordLock(metadata.id));
  return SaveMetadataLocked(metadata, priority);
}

rocksdb::Status RecordStore::SaveMetadataLocked(RecordMetadata metadata, Priority priority) {
  const uint64_t now = opt_.clock->NowMillis();
  metadata.updated_at_ms = now;
  if (metadata.created_at_ms == 0) metadata.created_at_ms = now;
  metadata.storage_version = kStorageVersion;

  WriteJson(keys::MetadataKey(metadata.id), keys::MetadataCacheKey(metadata.id),
            metadata.ToJson(), priority);
  EmitCounter(opt_.metrics, "sessionvault.records.metadata.saved_total", 1);
  return AddToIndex(metadata.id);
}

rocksdb::Status RecordStore::LoadMetadata(std::string_view id, RecordMetadata* metadata) {
  if (!metadata) return rocksdb::Status::InvalidArgument("metadata is null");
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");

  Json::Value v;
  rocksdb::Status s = ReadJson(keys::MetadataKey(id), keys::MetadataCacheKey(id), &v);
  if (!s.ok()) return s;
  if (!RecordMetadata::FromJson(v, metadata)) {
    return rocksdb::Status::Corruption("malformed record metadata", std::string(id));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::ListRecordIds(std::vector<std::string>* ids) {
  if (!ids) return rocksdb::Status::InvalidArgument("ids is null");
  std::lock_guard<std::mutex> lock(index_mu_);
  rocksdb::Status s = LoadIndexLocked();
  if (!s.ok()) return s;
  *ids = *index_;
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::ListAllMetadata(std::vector<RecordMetadata>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  std::vector<std::string> ids;
  rocksdb::Status s = ListRecordIds(&ids);
  if (!s.ok()) return s;

  for (const auto& id : ids) {
    RecordMetadata md;
    s = LoadMetadata(id, &md);
    if (s.IsNotFound()) {
      Logger()->warn("records: indexed record {} has no metadata", id);
      continue;
    }
    if (!s.ok()) return s;
    out->push_back(std::move(md));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::IsChunked(std::string_view id, bool* chunked) {
  if (!chunked) return rocksdb::Status::InvalidArgument("chunked is null");
  *chunked = false;

  RecordMetadata md;
  rocksdb::Status s = LoadMetadata(id, &md);
  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;
  *chunked = md.storage_version == kStorageVersion;
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Record index
// ---------------------------------------------------------------------------

rocksdb::Status RecordStore::LoadIndexLocked() {
  if (index_) return rocksdb::Status::OK();

  Json::Value v;
  rocksdb::Status s = ReadJson(keys::kRecordIndex, std::string(), &v);
  if (s.IsNotFound()) {
    index_.emplace();
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;
  if (!v.isArray()) return rocksdb::Status::Corruption("record index is not an array");

  std::vector<std::string> ids;
  for (const auto& id : v) ids.push_back(id.asString());
  index_ = std::move(ids);
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::AddToIndex(const std::string& id) {
  std::lock_guard<std::mutex> lock(index_mu_);
  rocksdb::Status s = LoadIndexLocked();
  if (!s.ok()) return s;
  if (std::find(index_->begin(), index_->end(), id) != index_->end()) {
    return rocksdb::Status::OK();
  }

  index_->push_back(id);
  Json::Value v(Json::arrayValue);
  for (const auto& x : *index_) v.append(x);
  queue_->Enqueue(keys::kRecordIndex, internal::WriteJson(v), Priority::kCritical);
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::RemoveFromIndex(const std::string& id) {
  std::lock_guard<std::mutex> lock(index_mu_);
  rocksdb::Status s = LoadIndexLocked();
  if (!s.ok()) return s;
  auto it = std::find(index_->begin(), index_->end(), id);
  if (it == index_->end()) return rocksdb::Status::OK();

  index_->erase(it);
  Json::Value v(Json::arrayValue);
  for (const auto& x : *index_) v.append(x);
  queue_->Enqueue(keys::kRecordIndex, internal::WriteJson(v), Priority::kCritical);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Chunks
// ---------------------------------------------------------------------------

uint64_t RecordStore::ItemsPerChunk(std::string_view type) const {
  auto it = opt_.items_per_chunk.find(std::string(type));
  if (it != opt_.items_per_chunk.end() && it->second > 0) return it->second;
  return opt_.default_items_per_chunk;
}

rocksdb::Status RecordStore::SaveChunk(std::string_view id, std::string_view type,
                                       uint64_t index, const Chunk& chunk, Priority priority) {
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  if (!IsValidSegment(type)) return rocksdb::Status::InvalidArgument("invalid chunk type");
  std::lock_guard<std::mutex> lock(RecordLock(id));
  return SaveChunkLocked(id, type, index, chunk, priority);
}

rocksdb::Status RecordStore::SaveChunkLocked(std::string_view id, std::string_view type,
                                             uint64_t index, const Chunk& chunk,
                                             Priority priority) {
  Chunk c = chunk;
  c.record_id = std::string(id);
  c.chunk_type = std::string(type);
  c.index = index;

  WriteJson(keys::ChunkKey(id, type, index), keys::ChunkCacheKey(id, type, index),
            c.ToJson(), priority);
  EmitCounter(opt_.metrics, "sessionvault.records.chunk.saved_total", 1);
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::LoadChunk(std::string_view id, std::string_view type,
                                       uint64_t index, Chunk* chunk) {
  if (!chunk) return rocksdb::Status::InvalidArgument("chunk is null");
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  if (!IsValidSegment(type)) return rocksdb::Status::InvalidArgument("invalid chunk type");

  Json::Value v;
  rocksdb::Status s = ReadJson(keys::ChunkKey(id, type, index),
                               keys::ChunkCacheKey(id, type, index), &v);
  if (s.IsNotFound()) {
    *chunk = Chunk{std::string(id), std::string(type), index, {}};
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;
  if (!Chunk::FromJson(v, chunk)) {
    return rocksdb::Status::Corruption("malformed chunk", keys::ChunkKey(id, type, index));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::SaveItems(std::string_view id, std::string_view type,
                                       const std::vector<ChunkItem>& items, Priority priority) {
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  if (!IsValidSegment(type)) return rocksdb::Status::InvalidArgument("invalid chunk type");
  std::lock_guard<std::mutex> lock(RecordLock(id));

  RecordMetadata md;
  rocksdb::Status s = LoadMetadata(id, &md);
  const bool has_metadata = s.ok();
  if (!s.ok() && !s.IsNotFound()) return s;

  const std::string t(type);
  const uint64_t per = ItemsPerChunk(type);
  const uint64_t chunk_count = CeilDiv(items.size(), per);

  for (uint64_t i = 0; i < chunk_count; ++i) {
    Chunk c;
    const size_t begin = static_cast<size_t>(i * per);
    const size_t end = std::min(items.size(), static_cast<size_t>((i + 1) * per));
    c.items.assign(items.begin() + begin, items.begin() + end);
    s = SaveChunkLocked(id, type, i, c, priority);
    if (!s.ok()) return s;
  }

  if (!has_metadata) {
    Logger()->warn("records: saved {} {} item(s) for {} which has no metadata",
                   items.size(), t, id);
    return rocksdb::Status::OK();
  }

  // Chunks past the new end belong to the previous, longer list.
  auto it = md.chunks.find(t);
  if (it != md.chunks.end()) {
    for (uint64_t i = chunk_count; i < it->second.chunk_count; ++i) {
      cache_.Invalidate(keys::ChunkCacheKey(id, type, i));
      queue_->EnqueueDelete(keys::ChunkKey(id, type, i), priority);
    }
  }

  md.chunks[t] = ChunkManifest{items.size(), chunk_count, per};
  return SaveMetadataLocked(std::move(md), priority);
}

rocksdb::Status RecordStore::AppendItem(std::string_view id, std::string_view type,
                                        const ChunkItem& item, Priority priority) {
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  if (!IsValidSegment(type)) return rocksdb::Status::InvalidArgument("invalid chunk type");
  std::lock_guard<std::mutex> lock(RecordLock(id));

  RecordMetadata md;
  rocksdb::Status s = LoadMetadata(id, &md);
  if (s.IsNotFound()) {
    Logger()->warn("records: cannot append to unknown record {}", id);
    return s;
  }
  if (!s.ok()) return s;

  ChunkManifest& manifest = md.chunks[std::string(type)];
  const uint64_t per = manifest.chunk_size > 0 ? manifest.chunk_size : ItemsPerChunk(type);
  const uint64_t index = manifest.count / per;

  Chunk c;
  s = LoadChunk(id, type, index, &c);
  if (!s.ok()) return s;
  c.items.push_back(item);
  s = SaveChunkLocked(id, type, index, c, priority);
  if (!s.ok()) return s;

  manifest.count += 1;
  manifest.chunk_size = per;
  manifest.chunk_count = CeilDiv(manifest.count, per);
  return SaveMetadataLocked(std::move(md), priority);
}

rocksdb::Status RecordStore::LoadAllItems(std::string_view id, std::string_view type,
                                          std::vector<ChunkItem>* items) {
  if (!items) return rocksdb::Status::InvalidArgument("items is null");
  items->clear();

  RecordMetadata md;
  rocksdb::Status s = LoadMetadata(id, &md);
  if (!s.ok()) return s;

  auto it = md.chunks.find(std::string(type));
  if (it == md.chunks.end()) return rocksdb::Status::OK();
  return LoadItemsFromManifest(id, type, it->second, items);
}

rocksdb::Status RecordStore::LoadItemsFromManifest(std::string_view id,
                                                   std::string_view type,
                                                   const ChunkManifest& manifest,
                                                   std::vector<ChunkItem>* items) {
  for (uint64_t i = 0; i < manifest.chunk_count; ++i) {
    Chunk c;
    rocksdb::Status s = LoadChunk(id, type, i, &c);
    if (!s.ok()) return s;
    for (auto& item : c.items) items->push_back(std::move(item));
  }
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Whole records
// ---------------------------------------------------------------------------

rocksdb::Status RecordStore::LoadFullRecord(std::string_view id, FullRecord* record) {
  if (!record) return rocksdb::Status::InvalidArgument("record is null");
  *record = FullRecord{};

  rocksdb::Status s = LoadMetadata(id, &record->metadata);
  if (!s.ok()) return s;

  for (const auto& kv : record->metadata.chunks) {
    std::vector<ChunkItem>& items = record->items[kv.first];
    s = LoadItemsFromManifest(id, kv.first, kv.second, &items);
    if (!s.ok()) return s;
  }

  for (const auto& name : record->metadata.large_objects) {
    Json::Value v;
    s = LoadLargeObject(id, name, &v);
    if (s.IsNotFound()) {
      Logger()->debug("records: {} lists object {} which was never written", id, name);
      continue;
    }
    if (!s.ok()) return s;
    record->large_objects.emplace(name, std::move(v));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::SaveFullRecord(const FullRecord& record, Priority priority) {
  const std::string& id = record.metadata.id;
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  for (const auto& kv : record.items) {
    if (!IsValidSegment(kv.first)) return rocksdb::Status::InvalidArgument("invalid chunk type");
  }
  for (const auto& kv : record.large_objects) {
    if (!IsValidSegment(kv.first)) return rocksdb::Status::InvalidArgument("invalid object name");
  }
  std::lock_guard<std::mutex> lock(RecordLock(id));

  RecordMetadata previous;
  rocksdb::Status s = LoadMetadata(id, &previous);
  const bool had_previous = s.ok();
  if (!s.ok() && !s.IsNotFound()) return s;

  // References first, so a missing blob fails the call with nothing written.
  std::vector<std::pair<std::string, std::string>> added;
  for (const auto& kv : record.items) {
    for (const auto& item : kv.second) {
      if (item.attachment_hash.empty()) continue;
      std::vector<Reference> refs;
      s = content_->References(item.attachment_hash, &refs);
      if (s.ok()) {
        const bool had = std::any_of(refs.begin(), refs.end(), [&](const Reference& r) {
          return r.owner_id == id && r.attachment_id == item.id;
        });
        s = content_->AddReference(item.attachment_hash, id, item.id);
        if (s.ok() && !had) added.emplace_back(item.attachment_hash, item.id);
      }
      if (!s.ok()) {
        Logger()->error("records: cannot reference {} from {}/{}: {}", item.attachment_hash,
                        id, item.id, s.ToString());
        for (const auto& ref : added) {
          rocksdb::Status rs = content_->RemoveReference(ref.first, id, ref.second);
          if (!rs.ok()) {
            Logger()->error("records: releasing {} for {}/{} failed: {}", ref.first, id,
                            ref.second, rs.ToString());
          }
        }
        return s;
      }
    }
  }

  RecordMetadata md = record.metadata;
  md.chunks.clear();
  md.large_objects.clear();
  if (md.created_at_ms == 0 && had_previous) md.created_at_ms = previous.created_at_ms;

  for (const auto& kv : record.items) {
    const std::string& type = kv.first;
    const std::vector<ChunkItem>& items = kv.second;
    const uint64_t per = ItemsPerChunk(type);
    const uint64_t chunk_count = CeilDiv(items.size(), per);
    for (uint64_t i = 0; i < chunk_count; ++i) {
      Chunk c;
      const size_t begin = static_cast<size_t>(i * per);
      const size_t end = std::min(items.size(), static_cast<size_t>((i + 1) * per));
      c.items.assign(items.begin() + begin, items.begin() + end);
      s = SaveChunkLocked(id, type, i, c, priority);
      if (!s.ok()) return s;
    }
    md.chunks[type] = ChunkManifest{items.size(), chunk_count, per};
  }

  for (const auto& kv : record.large_objects) {
    WriteJson(keys::ObjectKey(id, kv.first), keys::ObjectCacheKey(id, kv.first), kv.second,
              priority);
    md.large_objects.insert(kv.first);
  }

  if (had_previous) {
    for (const auto& kv : previous.chunks) {
      auto now = md.chunks.find(kv.first);
      const uint64_t keep = now == md.chunks.end() ? 0 : now->second.chunk_count;
      for (uint64_t i = keep; i < kv.second.chunk_count; ++i) {
        cache_.Invalidate(keys::ChunkCacheKey(id, kv.first, i));
        queue_->EnqueueDelete(keys::ChunkKey(id, kv.first, i), priority);
      }
    }
    for (const auto& name : previous.large_objects) {
      if (md.large_objects.count(name) > 0) continue;
      cache_.Invalidate(keys::ObjectCacheKey(id, name));
      queue_->EnqueueDelete(keys::ObjectKey(id, name), priority);
    }
  }

  EmitCounter(opt_.metrics, "sessionvault.records.full.saved_total", 1);
  return SaveMetadataLocked(std::move(md), priority);
}

// ---------------------------------------------------------------------------
// Large objects
// ---------------------------------------------------------------------------

rocksdb::Status RecordStore::SaveLargeObject(std::string_view id, std::string_view name,
                                             const Json::Value& value, Priority priority) {
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  if (!IsValidSegment(name)) return rocksdb::Status::InvalidArgument("invalid object name");
  std::lock_guard<std::mutex> lock(RecordLock(id));

  WriteJson(keys::ObjectKey(id, name), keys::ObjectCacheKey(id, name), value, priority);
  EmitCounter(opt_.metrics, "sessionvault.records.object.saved_total", 1);

  RecordMetadata md;
  rocksdb::Status s = LoadMetadata(id, &md);
  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;
  if (!md.large_objects.insert(std::string(name)).second) return rocksdb::Status::OK();
  return SaveMetadataLocked(std::move(md), priority);
}

rocksdb::Status RecordStore::LoadLargeObject(std::string_view id, std::string_view name,
                                             Json::Value* value) {
  if (!value) return rocksdb::Status::InvalidArgument("value is null");
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  if (!IsValidSegment(name)) return rocksdb::Status::InvalidArgument("invalid object name");
  return ReadJson(keys::ObjectKey(id, name), keys::ObjectCacheKey(id, name), value);
}

// ---------------------------------------------------------------------------
// Attachments
// ---------------------------------------------------------------------------

rocksdb::Status RecordStore::SaveAttachment(std::string_view id, std::string_view type,
                                            uint64_t chunk_index, std::string_view item_id,
                                            const Blob& blob, std::string* hash) {
  if (!hash) return rocksdb::Status::InvalidArgument("hash is null");
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  if (!IsValidSegment(type)) return rocksdb::Status::InvalidArgument("invalid chunk type");
  if (item_id.empty()) return rocksdb::Status::InvalidArgument("empty item id");
  std::lock_guard<std::mutex> lock(RecordLock(id));

  std::string h;
  rocksdb::Status s = content_->Save(blob, &h);
  if (!s.ok()) return s;

  std::vector<Reference> refs;
  s = content_->References(h, &refs);
  if (!s.ok()) return s;
  const bool had_reference =
      std::any_of(refs.begin(), refs.end(), [&](const Reference& r) {
        return r.owner_id == id && r.attachment_id == item_id;
      });

  s = content_->AddReference(h, id, item_id);
  if (!s.ok()) return s;

  // Undo a reference added by this call when the chunk cannot be updated.
  auto release = [&](const rocksdb::Status& cause) {
    if (had_reference) return cause;
    rocksdb::Status rs = content_->RemoveReference(h, id, item_id);
    if (!rs.ok()) {
      Logger()->error("records: releasing {} for {}/{} after failure failed: {}", h, id,
                      item_id, rs.ToString());
    }
    return cause;
  };

  Chunk c;
  s = LoadChunk(id, type, chunk_index, &c);
  if (!s.ok()) return release(s);

  std::string previous;
  bool created = false;
  auto it = std::find_if(c.items.begin(), c.items.end(),
                         [&](const ChunkItem& x) { return x.id == item_id; });
  if (it == c.items.end()) {
    ChunkItem item;
    item.id = std::string(item_id);
    item.attachment_hash = h;
    c.items.push_back(std::move(item));
    created = true;
  } else {
    previous = it->attachment_hash;
    it->attachment_hash = h;
  }

  s = SaveChunkLocked(id, type, chunk_index, c, Priority::kNormal);
  if (!s.ok()) return release(s);

  if (created) {
    RecordMetadata md;
    s = LoadMetadata(id, &md);
    if (s.ok()) {
      ChunkManifest& manifest = md.chunks[std::string(type)];
      if (manifest.chunk_size == 0) manifest.chunk_size = ItemsPerChunk(type);
      manifest.count += 1;
      manifest.chunk_count = std::max(manifest.chunk_count, chunk_index + 1);
      s = SaveMetadataLocked(std::move(md), Priority::kNormal);
      if (!s.ok()) return s;
    } else if (!s.IsNotFound()) {
      return s;
    }
  }

  if (!previous.empty() && previous != h) {
    s = content_->RemoveReference(previous, id, item_id);
    if (!s.ok()) {
      Logger()->error("records: releasing {} for {}/{} failed: {}", previous, id, item_id,
                      s.ToString());
      return s;
    }
  }

  EmitCounter(opt_.metrics, "sessionvault.records.attachment.saved_total", 1);
  *hash = std::move(h);
  return rocksdb::Status::OK();
}

rocksdb::Status RecordStore::LoadAttachment(std::string_view hash, Blob* blob) {
  return content_->Load(hash, blob);
}

// ---------------------------------------------------------------------------
// Lifecycle & cache
// ---------------------------------------------------------------------------

rocksdb::Status RecordStore::DeleteRecord(std::string_view id) {
  if (!IsValidSegment(id)) return rocksdb::Status::InvalidArgument("invalid record id");
  std::lock_guard<std::mutex> lock(RecordLock(id));
  const std::string rid(id);

  // Every stored or still-queued part of the record.
  const std::string prefix = keys::RecordPrefix(id);
  std::vector<std::pair<std::string, std::string>> stored;
  rocksdb::Status s = backend_->Scan(prefix, &stored);
  if (!s.ok()) return s;

  std::set<std::string> parts;
  for (const auto& kv : stored) parts.insert(kv.first);
  for (auto& k : queue_->PendingKeys(prefix)) parts.insert(std::move(k));

  if (parts.empty()) {
    Logger()->debug("records: delete of unknown record {} ignored", rid);
    return RemoveFromIndex(rid);
  }

  // Collect attachment hashes from every chunk.
  std::set<std::string> hashes;
  for (const auto& key : parts) {
    if (key.find("/chunk-") == std::string::npos) continue;
    Json::Value v;
    s = ReadJson(key, std::string(), &v);
    if (s.IsNotFound()) continue;
    if (!s.ok()) {
      Logger()->error("records: cannot read {} while deleting {}: {}", key, rid, s.ToString());
      continue;
    }
    Chunk c;
    if (!Chunk::FromJson(v, &c)) continue;
    for (const auto& item : c.items) {
      if (!item.attachment_hash.empty()) hashes.insert(item.attachment_hash);
    }
  }

  rocksdb::Status first_error;
  for (const auto& h : hashes) {
    rocksdb::Status rs = content_->RemoveReference(h, rid);
    if (!rs.ok()) {
      Logger()->error("records: releasing {} for {} failed: {}", h, rid, rs.ToString());
      if (first_error.ok()) first_error = rs;
    }
  }

  ClearRecordCache(rid);
  for (const auto& key : parts) queue_->EnqueueDelete(key, Priority::kCritical);

  s = RemoveFromIndex(rid);
  if (!s.ok() && first_error.ok()) first_error = s;

  EmitCounter(opt_.metrics, "sessionvault.records.deleted_total", 1);
  Logger()->info("records: deleted {} ({} part(s), {} attachment(s) released)", rid,
                 parts.size(), hashes.size());
  return first_error;
}

size_t RecordStore::ClearRecordCache(std::string_view id) {
  size_t n = 0;
  if (cache_.Invalidate(keys::MetadataCacheKey(id))) ++n;
  n += cache_.InvalidatePattern(std::string_view(keys::ChunkCachePrefix(id)));
  n += cache_.InvalidatePattern(std::string_view(keys::ObjectCachePrefix(id)));
  Logger()->debug("records: invalidated {} cache entr{} for {}", n, n == 1 ? "y" : "ies", id);
  return n;
}

void RecordStore::ClearCache() {
  cache_.Clear();
  Logger()->debug("records: cache cleared");
}

void RecordStore::PruneCache() { cache_.Prune(); }

void RecordStore::SetCacheSize(uint64_t max_size_bytes) {
  Logger()->info("records: cache size set to {} bytes", max_size_bytes);
  cache_.Resize(max_size_bytes);
}

CacheStats RecordStore::GetCacheStats() const { return cache_.GetStats(); }

void RecordStore::ResetCacheStats() { cache_.ResetStats(); }

}  // namespace sessionvault

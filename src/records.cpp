#include <sessionvault/records.hpp>

#include <fmt/format.h>

#include <sessionvault/internal.hpp>

namespace sessionvault {

Json::Value RecordMetadata::ToJson() const {
  Json::Value v(Json::objectValue);
  v["id"] = id;
  v["fields"] = fields;

  Json::Value jc(Json::objectValue);
  for (const auto& kv : chunks) {
    Json::Value m(Json::objectValue);
    m["count"] = Json::UInt64(kv.second.count);
    m["chunk_count"] = Json::UInt64(kv.second.chunk_count);
    m["chunk_size"] = Json::UInt64(kv.second.chunk_size);
    jc[kv.first] = m;
  }
  v["chunks"] = jc;

  Json::Value lo(Json::arrayValue);
  for (const auto& name : large_objects) lo.append(name);
  v["large_objects"] = lo;

  v["storage_version"] = storage_version;
  v["created_at_ms"] = Json::UInt64(created_at_ms);
  v["updated_at_ms"] = Json::UInt64(updated_at_ms);
  return v;
}

bool RecordMetadata::FromJson(const Json::Value& v, RecordMetadata* out) {
  if (!out || !v.isObject() || !v["id"].isString()) return false;

  RecordMetadata m;
  m.id = v["id"].asString();
  if (v.isMember("fields")) m.fields = v["fields"];

  const Json::Value& jc = v["chunks"];
  if (jc.isObject()) {
    for (const auto& name : jc.getMemberNames()) {
      const Json::Value& jm = jc[name];
      ChunkManifest cm;
      cm.count = jm.get("count", Json::UInt64(0)).asUInt64();
      cm.chunk_count = jm.get("chunk_count", Json::UInt64(0)).asUInt64();
      cm.chunk_size = jm.get("chunk_size", Json::UInt64(0)).asUInt64();
      m.chunks.emplace(name, cm);
    }
  }

  const Json::Value& lo = v["large_objects"];
  if (lo.isArray()) {
    for (const auto& name : lo) m.large_objects.insert(name.asString());
  }

  m.storage_version = v.get("storage_version", Json::Int(0)).asInt();
  m.created_at_ms = v.get("created_at_ms", Json::UInt64(0)).asUInt64();
  m.updated_at_ms = v.get("updated_at_ms", Json::UInt64(0)).asUInt64();
  *out = std::move(m);
  return true;
}

Json::Value ChunkItem::ToJson() const {
  Json::Value v(Json::objectValue);
  v["id"] = id;
  v["data"] = data;
  if (!attachment_hash.empty()) v["attachment_hash"] = attachment_hash;
  return v;
}

bool ChunkItem::FromJson(const Json::Value& v, ChunkItem* out) {
  if (!out || !v.isObject()) return false;
  out->id = v.get("id", "").asString();
  out->data = v["data"];
  out->attachment_hash = v.get("attachment_hash", "").asString();
  return true;
}

Json::Value Chunk::ToJson() const {
  Json::Value v(Json::objectValue);
  v["record_id"] = record_id;
  v["chunk_type"] = chunk_type;
  v["index"] = Json::UInt64(index);

  Json::Value ji(Json::arrayValue);
  for (const auto& item : items) ji.append(item.ToJson());
  v["items"] = ji;
  return v;
}

bool Chunk::FromJson(const Json::Value& v, Chunk* out) {
  if (!out || !v.isObject()) return false;

  Chunk c;
  c.record_id = v.get("record_id", "").asString();
  c.chunk_type = v.get("chunk_type", "").asString();
  c.index = v.get("index", Json::UInt64(0)).asUInt64();

  const Json::Value& ji = v["items"];
  if (!ji.isNull() && !ji.isArray()) return false;
  for (const auto& jv : ji) {
    ChunkItem item;
    if (!ChunkItem::FromJson(jv, &item)) return false;
    c.items.push_back(std::move(item));
  }
  *out = std::move(c);
  return true;
}

size_t EstimateJsonBytes(const Json::Value& v) {
  if (v.isNull()) return 0;
  if (v.isString()) return v.asString().size();
  if (v.isNumeric() || v.isBool()) return 8;
  return internal::WriteJson(v).size();
}

namespace keys {

std::string MetadataCacheKey(std::string_view id) {
  return fmt::format("metadata:{}", id);
}

std::string ChunkCacheKey(std::string_view id, std::string_view type, uint64_t index) {
  return fmt::format("chunk:{}:{}:{}", id, type, index);
}

std::string ObjectCacheKey(std::string_view id, std::string_view name) {
  return fmt::format("object:{}:{}", id, name);
}

std::string ChunkCachePrefix(std::string_view id) {
  return fmt::format("chunk:{}:", id);
}

std::string ObjectCachePrefix(std::string_view id) {
  return fmt::format("object:{}:", id);
}

std::string MetadataKey(std::string_view id) {
  return fmt::format("records/{}/metadata", id);
}

std::string ChunkKey(std::string_view id, std::string_view type, uint64_t index) {
  return fmt::format("records/{}/{}/chunk-{:03}", id, type, index);
}

std::string ObjectKey(std::string_view id, std::string_view name) {
  return fmt::format("records/{}/objects/{}", id, name);
}

std::string RecordPrefix(std::string_view id) {
  return fmt::format("records/{}/", id);
}

}  // namespace keys

}  // namespace sessionvault

#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace sessionvault {

// Layout version stamped on every saved RecordMetadata.
constexpr int kStorageVersion = 1;

// Well-known chunk types. Any other name is accepted as well.
constexpr const char* kScreenshots = "screenshots";
constexpr const char* kAudioSegments = "audio-segments";
constexpr const char* kVideoChunks = "video-chunks";

/** Where the items of one chunk type live. */
struct ChunkManifest {
  uint64_t count = 0;        // total items
  uint64_t chunk_count = 0;  // ceil(count / chunk_size)
  uint64_t chunk_size = 0;   // items per chunk
};

/**
 * Small, frequently read part of a record. Domain fields are opaque JSON;
 * everything bulky lives in chunks or named large objects.
 */
struct RecordMetadata {
  std::string id;
  Json::Value fields = Json::Value(Json::objectValue);
  std::map<std::string, ChunkManifest> chunks;
  std::set<std::string> large_objects;
  int storage_version = kStorageVersion;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  Json::Value ToJson() const;
  static bool FromJson(const Json::Value& v, RecordMetadata* out);
};

/** One element of a chunk. attachment_hash is empty when no blob is attached. */
struct ChunkItem {
  std::string id;
  Json::Value data;
  std::string attachment_hash;

  Json::Value ToJson() const;
  static bool FromJson(const Json::Value& v, ChunkItem* out);
};

struct Chunk {
  std::string record_id;
  std::string chunk_type;
  uint64_t index = 0;
  std::vector<ChunkItem> items;

  Json::Value ToJson() const;
  static bool FromJson(const Json::Value& v, Chunk* out);
};

/** Every part of one record: metadata, items per chunk type, large objects by name. */
struct FullRecord {
  RecordMetadata metadata;
  std::map<std::string, std::vector<ChunkItem>> items;
  std::map<std::string, Json::Value> large_objects;
};

/** Approximate resident size of a JSON value: its compact encoding length. */
size_t EstimateJsonBytes(const Json::Value& v);

namespace keys {

// Cache keys
std::string MetadataCacheKey(std::string_view id);
std::string ChunkCacheKey(std::string_view id, std::string_view type, uint64_t index);
std::string ObjectCacheKey(std::string_view id, std::string_view name);

// Prefixes matching every chunk / object cache entry of a record
std::string ChunkCachePrefix(std::string_view id);
std::string ObjectCachePrefix(std::string_view id);

// Backend keys
constexpr const char* kRecordIndex = "records/index";

std::string MetadataKey(std::string_view id);
std::string ChunkKey(std::string_view id, std::string_view type, uint64_t index);  // .../chunk-007
std::string ObjectKey(std::string_view id, std::string_view name);
std::string RecordPrefix(std::string_view id);

}  // namespace keys

}  // namespace sessionvault

// Unit tests for the chunked record coordinator
// Tests: read-after-write, chunking, large objects, attachments, record deletion

#include <gtest/gtest.h>

#include <sessionvault/content_store.hpp>
#include <sessionvault/database.hpp>
#include <sessionvault/internal.hpp>
#include <sessionvault/record_store.hpp>
#include <sessionvault/test_utils.hpp>
#include <sessionvault/write_queue.hpp>

#include <string>
#include <vector>

namespace sessionvault {
namespace {

// =============================================================================
// Test Fixture
// =============================================================================

class RecordStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(Database::Open(dir_.string() + "/db", &db_).ok());
    content_ = std::make_unique<ContentStore>(db_.get());

    WriteQueueOptions qopt;
    qopt.normal_interval_ms = 5;
    qopt.low_idle_interval_ms = 5;
    queue_ = std::make_unique<WriteQueue>(&backend_, qopt);

    RecordStoreOptions ropt;
    ropt.clock = clock_;
    ropt.cache.clock = clock_;
    store_ = std::make_unique<RecordStore>(&backend_, queue_.get(), content_.get(), ropt);
  }

  void TearDown() override {
    store_.reset();
    queue_->Shutdown();
    queue_.reset();
    content_.reset();
    db_.reset();
  }

  // Persist everything queued so far.
  void Persist() {
    queue_->Start();
    queue_->Flush();
  }

  RecordMetadata NewRecord(const std::string& id) {
    RecordMetadata md;
    md.id = id;
    md.fields["title"] = "session " + id;
    return md;
  }

  static std::vector<ChunkItem> Items(int n) {
    std::vector<ChunkItem> items;
    for (int i = 0; i < n; ++i) {
      ChunkItem item;
      item.id = "item-" + std::to_string(i);
      item.data["t"] = i;
      items.push_back(std::move(item));
    }
    return items;
  }

  testing::TempDir dir_{"sessionvault_records_test_"};
  std::shared_ptr<testing::FakeClock> clock_ = std::make_shared<testing::FakeClock>();
  testing::MemoryBackend backend_;
  std::unique_ptr<Database> db_;
  std::unique_ptr<ContentStore> content_;
  std::unique_ptr<WriteQueue> queue_;
  std::unique_ptr<RecordStore> store_;
};

// =============================================================================
// Metadata
// =============================================================================

TEST_F(RecordStoreTest, ReadAfterWriteBeforePersist) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  EXPECT_FALSE(backend_.Has("records/r1/metadata"));

  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.fields["title"].asString(), "session r1");

  // Without the cache the pending queue write still answers.
  store_->ClearCache();
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.id, "r1");
}

TEST_F(RecordStoreTest, ReadFromBackendAfterPersist) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  Persist();
  EXPECT_TRUE(backend_.Has("records/r1/metadata"));
  EXPECT_TRUE(backend_.Has("records/index"));

  store_->ClearCache();
  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.fields["title"].asString(), "session r1");
}

TEST_F(RecordStoreTest, SaveStampsVersionAndTimestamps) {
  const uint64_t t0 = clock_->NowMillis();
  RecordMetadata in = NewRecord("r1");
  in.storage_version = 0;
  ASSERT_TRUE(store_->SaveMetadata(in).ok());

  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.storage_version, kStorageVersion);
  EXPECT_EQ(md.created_at_ms, t0);
  EXPECT_EQ(md.updated_at_ms, t0);

  clock_->AdvanceMs(1000);
  ASSERT_TRUE(store_->SaveMetadata(md).ok());
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.created_at_ms, t0);
  EXPECT_EQ(md.updated_at_ms, t0 + 1000);

  bool chunked = false;
  ASSERT_TRUE(store_->IsChunked("r1", &chunked).ok());
  EXPECT_TRUE(chunked);
  ASSERT_TRUE(store_->IsChunked("missing", &chunked).ok());
  EXPECT_FALSE(chunked);
}

TEST_F(RecordStoreTest, IsChunkedRequiresCurrentStorageVersion) {
  RecordMetadata other = NewRecord("other");
  other.storage_version = kStorageVersion + 1;
  ASSERT_TRUE(backend_.Put("records/other/metadata",
                           internal::WriteJson(other.ToJson())).ok());

  bool chunked = true;
  ASSERT_TRUE(store_->IsChunked("other", &chunked).ok());
  EXPECT_FALSE(chunked);
}

TEST_F(RecordStoreTest, LoadUnknownIsNotFound) {
  RecordMetadata md;
  EXPECT_TRUE(store_->LoadMetadata("nope", &md).IsNotFound());
}

TEST_F(RecordStoreTest, InvalidIdsRejected) {
  EXPECT_TRUE(store_->SaveMetadata(NewRecord("")).IsInvalidArgument());
  EXPECT_TRUE(store_->SaveMetadata(NewRecord("a/b")).IsInvalidArgument());
  EXPECT_TRUE(store_->SaveMetadata(NewRecord("a:b")).IsInvalidArgument());
  Chunk c;
  EXPECT_TRUE(store_->SaveChunk("r1", "bad/type", 0, c).IsInvalidArgument());
}

TEST_F(RecordStoreTest, IndexListsRecordsOnce) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r2")).ok());
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());

  std::vector<std::string> ids;
  ASSERT_TRUE(store_->ListRecordIds(&ids).ok());
  EXPECT_EQ(ids, (std::vector<std::string>{"r1", "r2"}));

  std::vector<RecordMetadata> all;
  ASSERT_TRUE(store_->ListAllMetadata(&all).ok());
  EXPECT_EQ(all.size(), 2u);
}

TEST_F(RecordStoreTest, IndexReloadedByNewStore) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  Persist();

  RecordStore fresh(&backend_, queue_.get(), content_.get());
  std::vector<std::string> ids;
  ASSERT_TRUE(fresh.ListRecordIds(&ids).ok());
  EXPECT_EQ(ids, (std::vector<std::string>{"r1"}));
}

// =============================================================================
// Chunks
// =============================================================================

TEST_F(RecordStoreTest, SaveItemsSplitsIntoChunks) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(store_->SaveItems("r1", kScreenshots, Items(45)).ok());

  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  const ChunkManifest& m = md.chunks.at(kScreenshots);
  EXPECT_EQ(m.count, 45u);
  EXPECT_EQ(m.chunk_size, 20u);
  EXPECT_EQ(m.chunk_count, 3u);

  Chunk last;
  ASSERT_TRUE(store_->LoadChunk("r1", kScreenshots, 2, &last).ok());
  EXPECT_EQ(last.items.size(), 5u);
  EXPECT_EQ(last.items[0].id, "item-40");

  std::vector<ChunkItem> items;
  ASSERT_TRUE(store_->LoadAllItems("r1", kScreenshots, &items).ok());
  ASSERT_EQ(items.size(), 45u);
  for (int i = 0; i < 45; ++i) EXPECT_EQ(items[i].data["t"].asInt(), i);

  Persist();
  EXPECT_TRUE(backend_.Has("records/r1/screenshots/chunk-000"));
  EXPECT_TRUE(backend_.Has("records/r1/screenshots/chunk-002"));
}

TEST_F(RecordStoreTest, ItemsPerChunkByType) {
  EXPECT_EQ(store_->ItemsPerChunk(kScreenshots), 20u);
  EXPECT_EQ(store_->ItemsPerChunk(kAudioSegments), 100u);
  EXPECT_EQ(store_->ItemsPerChunk("custom"), 100u);
}

TEST_F(RecordStoreTest, ShrinkingItemsDeletesStaleChunks) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(store_->SaveItems("r1", kScreenshots, Items(45)).ok());
  Persist();
  ASSERT_TRUE(backend_.Has("records/r1/screenshots/chunk-002"));

  ASSERT_TRUE(store_->SaveItems("r1", kScreenshots, Items(10)).ok());
  queue_->Flush();

  EXPECT_TRUE(backend_.Has("records/r1/screenshots/chunk-000"));
  EXPECT_FALSE(backend_.Has("records/r1/screenshots/chunk-001"));
  EXPECT_FALSE(backend_.Has("records/r1/screenshots/chunk-002"));

  std::vector<ChunkItem> items;
  ASSERT_TRUE(store_->LoadAllItems("r1", kScreenshots, &items).ok());
  EXPECT_EQ(items.size(), 10u);
}

TEST_F(RecordStoreTest, MissingChunkLoadsEmpty) {
  Chunk c;
  ASSERT_TRUE(store_->LoadChunk("r1", kVideoChunks, 7, &c).ok());
  EXPECT_TRUE(c.items.empty());
  EXPECT_EQ(c.index, 7u);
  EXPECT_EQ(c.chunk_type, kVideoChunks);
}

TEST_F(RecordStoreTest, AppendItemCrossesChunkBoundary) {
  ChunkItem item;
  item.id = "x";
  EXPECT_TRUE(store_->AppendItem("r1", kScreenshots, item).IsNotFound());

  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  for (int i = 0; i < 21; ++i) {
    item.id = "shot-" + std::to_string(i);
    ASSERT_TRUE(store_->AppendItem("r1", kScreenshots, item).ok());
  }

  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.chunks.at(kScreenshots).count, 21u);
  EXPECT_EQ(md.chunks.at(kScreenshots).chunk_count, 2u);

  Chunk second;
  ASSERT_TRUE(store_->LoadChunk("r1", kScreenshots, 1, &second).ok());
  ASSERT_EQ(second.items.size(), 1u);
  EXPECT_EQ(second.items[0].id, "shot-20");
}

// =============================================================================
// Large objects
// =============================================================================

TEST_F(RecordStoreTest, LargeObjectRoundTripAndListed) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  Json::Value summary(Json::objectValue);
  summary["text"] = std::string(4096, 's');
  ASSERT_TRUE(store_->SaveLargeObject("r1", "summary", summary, Priority::kLow).ok());

  Json::Value out;
  ASSERT_TRUE(store_->LoadLargeObject("r1", "summary", &out).ok());
  EXPECT_EQ(out["text"].asString().size(), 4096u);

  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.large_objects.count("summary"), 1u);

  EXPECT_TRUE(store_->LoadLargeObject("r1", "transcript", &out).IsNotFound());
}

// =============================================================================
// Attachments
// =============================================================================

TEST_F(RecordStoreTest, SaveAttachmentReferencesBlob) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(store_->SaveItems("r1", kScreenshots, Items(3)).ok());

  std::string hash;
  ASSERT_TRUE(store_->SaveAttachment("r1", kScreenshots, 0, "item-1",
                                     Blob{"png-bytes", "image/png"}, &hash).ok());

  uint64_t count = 0;
  ASSERT_TRUE(content_->ReferenceCount(hash, &count).ok());
  EXPECT_EQ(count, 1u);

  Chunk c;
  ASSERT_TRUE(store_->LoadChunk("r1", kScreenshots, 0, &c).ok());
  EXPECT_EQ(c.items[1].attachment_hash, hash);

  Blob blob;
  ASSERT_TRUE(store_->LoadAttachment(hash, &blob).ok());
  EXPECT_EQ(blob.data, "png-bytes");
}

TEST_F(RecordStoreTest, SaveAttachmentCreatesMissingItem) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  std::string hash;
  ASSERT_TRUE(store_->SaveAttachment("r1", kAudioSegments, 0, "seg-0",
                                     Blob{"pcm", "audio/wav"}, &hash).ok());

  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.chunks.at(kAudioSegments).count, 1u);
  EXPECT_EQ(md.chunks.at(kAudioSegments).chunk_count, 1u);
}

TEST_F(RecordStoreTest, RepointingAttachmentReleasesOldBlob) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  std::string original;
  ASSERT_TRUE(store_->SaveAttachment("r1", kScreenshots, 0, "shot",
                                     Blob{"raw-bytes", "image/png"}, &original).ok());
  std::string compressed;
  ASSERT_TRUE(store_->SaveAttachment("r1", kScreenshots, 0, "shot",
                                     Blob{"small", "image/webp"}, &compressed).ok());
  ASSERT_NE(original, compressed);

  uint64_t count = 0;
  ASSERT_TRUE(content_->ReferenceCount(original, &count).ok());
  EXPECT_EQ(count, 0u);
  ASSERT_TRUE(content_->ReferenceCount(compressed, &count).ok());
  EXPECT_EQ(count, 1u);

  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  EXPECT_EQ(md.chunks.at(kScreenshots).count, 1u);
}

TEST_F(RecordStoreTest, SaveAttachmentReleasesReferenceWhenChunkUnreadable) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(backend_.Put("records/r1/screenshots/chunk-000", "not json").ok());

  std::string hash;
  rocksdb::Status s = store_->SaveAttachment("r1", kScreenshots, 0, "shot",
                                             Blob{"orphaned", "image/png"}, &hash);
  EXPECT_TRUE(s.IsCorruption()) << s.ToString();

  uint64_t count = 1;
  ASSERT_TRUE(content_->ReferenceCount(internal::Sha256::HexDigest("orphaned"), &count).ok());
  EXPECT_EQ(count, 0u);
}

TEST_F(RecordStoreTest, FailedAttachmentKeepsExistingReference) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  std::string hash;
  ASSERT_TRUE(store_->SaveAttachment("r1", kScreenshots, 1, "shot",
                                     Blob{"frame", "image/png"}, &hash).ok());
  ASSERT_TRUE(backend_.Put("records/r1/screenshots/chunk-000", "not json").ok());

  std::string again;
  EXPECT_FALSE(store_->SaveAttachment("r1", kScreenshots, 0, "shot",
                                      Blob{"frame", "image/png"}, &again).ok());

  uint64_t count = 0;
  ASSERT_TRUE(content_->ReferenceCount(hash, &count).ok());
  EXPECT_EQ(count, 1u);
}

// =============================================================================
// Whole records
// =============================================================================

TEST_F(RecordStoreTest, FullRecordSavedAndReassembled) {
  std::string frame;
  ASSERT_TRUE(content_->Save("frame-bytes", "image/png", &frame).ok());

  FullRecord full;
  full.metadata = NewRecord("r1");
  full.items[kScreenshots] = Items(45);
  full.items[kScreenshots][0].attachment_hash = frame;
  full.items[kAudioSegments] = Items(3);
  full.large_objects["summary"] = "a short session";
  full.large_objects["transcription"]["text"] = "hello";
  ASSERT_TRUE(store_->SaveFullRecord(full).ok());
  Persist();

  // A fresh store reads everything back from the backend.
  RecordStore reader(&backend_, queue_.get(), content_.get());
  FullRecord back;
  ASSERT_TRUE(reader.LoadFullRecord("r1", &back).ok());

  EXPECT_EQ(back.metadata.fields["title"].asString(), "session r1");
  EXPECT_EQ(back.metadata.chunks.at(kScreenshots).chunk_count, 3u);
  ASSERT_EQ(back.items.at(kScreenshots).size(), 45u);
  EXPECT_EQ(back.items.at(kScreenshots)[44].id, "item-44");
  EXPECT_EQ(back.items.at(kScreenshots)[0].attachment_hash, frame);
  EXPECT_EQ(back.items.at(kAudioSegments).size(), 3u);
  ASSERT_EQ(back.large_objects.size(), 2u);
  EXPECT_EQ(back.large_objects.at("summary").asString(), "a short session");
  EXPECT_EQ(back.large_objects.at("transcription")["text"].asString(), "hello");

  uint64_t count = 0;
  ASSERT_TRUE(content_->ReferenceCount(frame, &count).ok());
  EXPECT_EQ(count, 1u);
}

TEST_F(RecordStoreTest, SaveFullRecordDropsPartsOfPreviousVersion) {
  FullRecord full;
  full.metadata = NewRecord("r1");
  full.items[kScreenshots] = Items(45);
  full.large_objects["summary"] = "v1";
  full.large_objects["notes"] = "scratch";
  ASSERT_TRUE(store_->SaveFullRecord(full).ok());
  Persist();

  RecordMetadata first;
  ASSERT_TRUE(store_->LoadMetadata("r1", &first).ok());
  clock_->AdvanceMs(1000);

  full.items[kScreenshots] = Items(10);
  full.large_objects.erase("notes");
  full.large_objects["summary"] = "v2";
  ASSERT_TRUE(store_->SaveFullRecord(full).ok());
  queue_->Flush();

  EXPECT_TRUE(backend_.Has("records/r1/screenshots/chunk-000"));
  EXPECT_FALSE(backend_.Has("records/r1/screenshots/chunk-001"));
  EXPECT_FALSE(backend_.Has("records/r1/screenshots/chunk-002"));
  EXPECT_FALSE(backend_.Has("records/r1/objects/notes"));

  FullRecord back;
  ASSERT_TRUE(store_->LoadFullRecord("r1", &back).ok());
  EXPECT_EQ(back.items.at(kScreenshots).size(), 10u);
  EXPECT_EQ(back.large_objects.size(), 1u);
  EXPECT_EQ(back.large_objects.at("summary").asString(), "v2");
  EXPECT_EQ(back.metadata.created_at_ms, first.created_at_ms);
  EXPECT_GT(back.metadata.updated_at_ms, first.updated_at_ms);
}

TEST_F(RecordStoreTest, SaveFullRecordWithUnknownAttachmentWritesNothing) {
  std::string known;
  ASSERT_TRUE(content_->Save("known", "image/png", &known).ok());

  FullRecord full;
  full.metadata = NewRecord("r1");
  full.items[kScreenshots] = Items(2);
  full.items[kScreenshots][0].attachment_hash = known;
  full.items[kScreenshots][1].attachment_hash = internal::Sha256::HexDigest("never stored");
  EXPECT_TRUE(store_->SaveFullRecord(full).IsNotFound());

  RecordMetadata md;
  EXPECT_TRUE(store_->LoadMetadata("r1", &md).IsNotFound());
  uint64_t count = 1;
  ASSERT_TRUE(content_->ReferenceCount(known, &count).ok());
  EXPECT_EQ(count, 0u);
}

TEST_F(RecordStoreTest, LoadFullRecordUnknownIsNotFound) {
  FullRecord back;
  EXPECT_TRUE(store_->LoadFullRecord("ghost", &back).IsNotFound());
}

// =============================================================================
// Deletion & cache
// =============================================================================

TEST_F(RecordStoreTest, DeleteRecordReleasesAttachmentsAndParts) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(store_->SaveItems("r1", kScreenshots, Items(2)).ok());
  std::string hash;
  ASSERT_TRUE(store_->SaveAttachment("r1", kScreenshots, 0, "item-0",
                                     Blob{"unique", "image/png"}, &hash).ok());
  ASSERT_TRUE(store_->SaveLargeObject("r1", "summary", Json::Value("text")).ok());
  Persist();

  ASSERT_TRUE(store_->DeleteRecord("r1").ok());
  queue_->Flush();

  RecordMetadata md;
  EXPECT_TRUE(store_->LoadMetadata("r1", &md).IsNotFound());
  Json::Value obj;
  EXPECT_TRUE(store_->LoadLargeObject("r1", "summary", &obj).IsNotFound());
  EXPECT_FALSE(backend_.Has("records/r1/screenshots/chunk-000"));

  std::vector<std::string> ids;
  ASSERT_TRUE(store_->ListRecordIds(&ids).ok());
  EXPECT_TRUE(ids.empty());

  uint64_t count = 1;
  ASSERT_TRUE(content_->ReferenceCount(hash, &count).ok());
  EXPECT_EQ(count, 0u);

  GcResult gc;
  ASSERT_TRUE(content_->CollectGarbage(&gc).ok());
  EXPECT_EQ(gc.deleted, 1u);
}

TEST_F(RecordStoreTest, DeleteRecordWithOnlyPendingWrites) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(store_->SaveItems("r1", kScreenshots, Items(2)).ok());

  ASSERT_TRUE(store_->DeleteRecord("r1").ok());
  RecordMetadata md;
  EXPECT_TRUE(store_->LoadMetadata("r1", &md).IsNotFound());

  Persist();
  EXPECT_FALSE(backend_.Has("records/r1/metadata"));
  EXPECT_FALSE(backend_.Has("records/r1/screenshots/chunk-000"));
}

TEST_F(RecordStoreTest, DeleteUnknownRecordIsNoop) {
  EXPECT_TRUE(store_->DeleteRecord("ghost").ok());
}

TEST_F(RecordStoreTest, ClearRecordCacheOnlyTouchesThatRecord) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r2")).ok());
  ASSERT_TRUE(store_->SaveItems("r1", kScreenshots, Items(1)).ok());

  EXPECT_EQ(store_->ClearRecordCache("r1"), 2u);
  EXPECT_EQ(store_->GetCacheStats().items, 1u);
}

TEST_F(RecordStoreTest, CacheSizeAndStats) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  RecordMetadata md;
  ASSERT_TRUE(store_->LoadMetadata("r1", &md).ok());
  auto stats = store_->GetCacheStats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_GT(stats.size_bytes, 0u);

  store_->SetCacheSize(1);
  EXPECT_EQ(store_->GetCacheStats().items, 0u);

  store_->ResetCacheStats();
  EXPECT_EQ(store_->GetCacheStats().hits, 0u);
}

TEST_F(RecordStoreTest, CacheEntriesExpire) {
  ASSERT_TRUE(store_->SaveMetadata(NewRecord("r1")).ok());
  clock_->AdvanceMs(5 * 60 * 1000 + 1);
  store_->PruneCache();
  EXPECT_EQ(store_->GetCacheStats().items, 0u);

  // Still readable from the queue.
  RecordMetadata md;
  EXPECT_TRUE(store_->LoadMetadata("r1", &md).ok());
}

// =============================================================================
// Codecs
// =============================================================================

TEST_F(RecordStoreTest, MetadataJsonRoundTrip) {
  RecordMetadata md = NewRecord("r1");
  md.chunks[kScreenshots] = ChunkManifest{45, 3, 20};
  md.large_objects.insert("summary");

  RecordMetadata back;
  ASSERT_TRUE(RecordMetadata::FromJson(md.ToJson(), &back));
  EXPECT_EQ(back.chunks.at(kScreenshots).chunk_count, 3u);
  EXPECT_EQ(back.large_objects.count("summary"), 1u);
  EXPECT_EQ(back.fields["title"].asString(), "session r1");
  EXPECT_FALSE(RecordMetadata::FromJson(Json::Value(42), &back));
}

TEST_F(RecordStoreTest, KeyLayout) {
  EXPECT_EQ(keys::ChunkKey("r1", kScreenshots, 7), "records/r1/screenshots/chunk-007");
  EXPECT_EQ(keys::MetadataKey("r1"), "records/r1/metadata");
  EXPECT_EQ(keys::ObjectKey("r1", "summary"), "records/r1/objects/summary");
  EXPECT_EQ(keys::ChunkCacheKey("r1", kScreenshots, 7), "chunk:r1:screenshots:7");
}

}  // namespace
}  // namespace sessionvault

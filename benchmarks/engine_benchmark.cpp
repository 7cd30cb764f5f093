// Performance benchmarks for the sessionvault engine
// Uses Google Benchmark
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound operations (SHA-256, cache, codecs)
// 2. MACROBENCHMARKS: ContentStore and RecordStore operations with I/O
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed dataset sizes for reproducible results

#include <benchmark/benchmark.h>

#include <sessionvault/cache.hpp>
#include <sessionvault/engine.hpp>
#include <sessionvault/internal.hpp>
#include <sessionvault/logging.hpp>
#include <sessionvault/records.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

class EngineBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    (void)state;
    sessionvault::SetLogLevel("warn");
    test_dir_ = std::filesystem::temp_directory_path() / ("sessionvault_bench_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "bench_db").string();
  }

  void TearDown(const benchmark::State& state) override {
    (void)state;
    engine_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  rocksdb::Status OpenEngine() {
    return sessionvault::Engine::Open(db_path_, &engine_);
  }

  std::string RandomSuffix() {
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen_));
  }

  std::string RandomBytes(size_t length) {
    std::string result(length, '\0');
    std::uniform_int_distribution<> dis(0, 255);
    for (size_t i = 0; i < length; ++i) result[i] = static_cast<char>(dis(gen_));
    return result;
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<sessionvault::Engine> engine_;
  std::mt19937 gen_{std::random_device{}()};
};

// =============================================================================
// PART 1: MICROBENCHMARKS
// =============================================================================

static void BM_SHA256(benchmark::State& state) {
  std::string data(static_cast<size_t>(state.range(0)), 'x');
  for (auto _ : state) {
    benchmark::DoNotOptimize(sessionvault::internal::Sha256::HexDigest(data));
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SHA256)->Range(64, 1 << 20);

static void BM_Cache_SetGet(benchmark::State& state) {
  sessionvault::CacheOptions opt;
  opt.max_items = static_cast<uint64_t>(state.range(0));
  sessionvault::Cache<std::string, std::string> cache(opt);

  std::vector<std::string> keys;
  for (int i = 0; i < 4096; ++i) keys.push_back("chunk:r:screenshots:" + std::to_string(i));
  const std::string value(256, 'v');

  size_t i = 0;
  for (auto _ : state) {
    const std::string& k = keys[i++ % keys.size()];
    cache.Set(k, value);
    benchmark::DoNotOptimize(cache.Get(k));
  }
}
BENCHMARK(BM_Cache_SetGet)->Arg(64)->Arg(1024);

static void BM_Chunk_Encode(benchmark::State& state) {
  sessionvault::Chunk chunk;
  chunk.record_id = "r1";
  chunk.chunk_type = sessionvault::kScreenshots;
  for (int i = 0; i < 20; ++i) {
    sessionvault::ChunkItem item;
    item.id = "shot-" + std::to_string(i);
    item.data["ts"] = i * 1000;
    item.attachment_hash = sessionvault::internal::Sha256::HexDigest(item.id);
    chunk.items.push_back(std::move(item));
  }
  for (auto _ : state) {
    benchmark::DoNotOptimize(sessionvault::internal::WriteJson(chunk.ToJson()));
  }
}
BENCHMARK(BM_Chunk_Encode);

// =============================================================================
// PART 2: MACROBENCHMARKS
// =============================================================================

BENCHMARK_DEFINE_F(EngineBenchmark, Content_SaveUnique)(benchmark::State& state) {
  if (!OpenEngine().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  const size_t kNumValues = 1000;
  std::vector<std::string> blobs;
  for (size_t i = 0; i < kNumValues; ++i) blobs.push_back(RandomBytes(state.range(0)));

  size_t idx = 0;
  for (auto _ : state) {
    std::string hash;
    auto s = engine_->content().Save(blobs[idx++ % kNumValues], "image/png", &hash);
    benchmark::DoNotOptimize(s);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(EngineBenchmark, Content_SaveUnique)->Range(1 << 10, 1 << 18);

BENCHMARK_DEFINE_F(EngineBenchmark, Content_SaveDuplicate)(benchmark::State& state) {
  if (!OpenEngine().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  const std::string blob = RandomBytes(50 * 1024);
  std::string hash;
  engine_->content().Save(blob, "image/png", &hash);

  for (auto _ : state) {
    auto s = engine_->content().Save(blob, "image/png", &hash);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK_REGISTER_F(EngineBenchmark, Content_SaveDuplicate);

BENCHMARK_DEFINE_F(EngineBenchmark, Records_AppendItem)(benchmark::State& state) {
  if (!OpenEngine().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  sessionvault::RecordMetadata md;
  md.id = "bench";
  engine_->records().SaveMetadata(md);

  sessionvault::ChunkItem item;
  item.data["x"] = 1;
  int64_t n = 0;
  for (auto _ : state) {
    item.id = "item-" + std::to_string(n++);
    auto s = engine_->records().AppendItem("bench", sessionvault::kScreenshots, item);
    benchmark::DoNotOptimize(s);
  }
  state.PauseTiming();
  engine_->queue().Flush();
  state.ResumeTiming();
}
BENCHMARK_REGISTER_F(EngineBenchmark, Records_AppendItem);

BENCHMARK_DEFINE_F(EngineBenchmark, Records_LoadMetadataCached)(benchmark::State& state) {
  if (!OpenEngine().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  sessionvault::RecordMetadata md;
  md.id = "hot";
  engine_->records().SaveMetadata(md);

  for (auto _ : state) {
    sessionvault::RecordMetadata out;
    auto s = engine_->records().LoadMetadata("hot", &out);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK_REGISTER_F(EngineBenchmark, Records_LoadMetadataCached);

}  // namespace

BENCHMARK_MAIN();

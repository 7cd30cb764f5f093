#include <sessionvault/engine.hpp>

#include <sessionvault/logging.hpp>
#include <sessionvault/version.hpp>

namespace sessionvault {

namespace {

template <typename T>
void Inherit(std::shared_ptr<T>* field, const std::shared_ptr<T>& value) {
  if (!*field) *field = value;
}

}  // namespace

Engine::Engine(EngineOptions opt) : opt_(std::move(opt)) {}

Engine::~Engine() {
  Shutdown();
}

rocksdb::Status Engine::Open(const std::string& db_path,
                             std::unique_ptr<Engine>* out,
                             EngineOptions opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->reset();

  if (!opt.clock) opt.clock = DefaultClock();
  Inherit(&opt.database.metrics, opt.metrics);
  Inherit(&opt.content.metrics, opt.metrics);
  Inherit(&opt.content.clock, opt.clock);
  Inherit(&opt.queue.metrics, opt.metrics);
  Inherit(&opt.queue.clock, opt.clock);
  Inherit(&opt.records.metrics, opt.metrics);
  Inherit(&opt.records.clock, opt.clock);
  Inherit(&opt.records.cache.clock, opt.clock);

  std::unique_ptr<Engine> engine(new Engine(std::move(opt)));

  auto s = Database::Open(db_path, &engine->db_, engine->opt_.database);
  if (!s.ok()) {
    Logger()->error("engine open failed path={} status={}", db_path, s.ToString());
    return s;
  }

  engine->backend_ = std::make_unique<RocksBackend>(engine->db_.get());
  engine->content_ = std::make_unique<ContentStore>(engine->db_.get(), engine->opt_.content);
  engine->queue_ = std::make_unique<WriteQueue>(engine->backend_.get(), engine->opt_.queue);
  engine->records_ = std::make_unique<RecordStore>(
      engine->backend_.get(), engine->queue_.get(), engine->content_.get(),
      engine->opt_.records);

  if (engine->opt_.start_queue) engine->queue_->Start();

  Logger()->info("engine opened path={} version={}", db_path, Version());
  *out = std::move(engine);
  return rocksdb::Status::OK();
}

void Engine::Shutdown() {
  if (queue_) {
    // Workers drain before stopping. A queue that was never started still
    // holds its items; start it so they reach the database.
    if (!queue_->IsRunning() && queue_->GetStats().pending > 0 && db_ && db_->IsOpen()) {
      queue_->Start();
    }
    queue_->Shutdown();
  }
  if (db_ && db_->IsOpen()) {
    db_->Close();
    Logger()->info("engine closed");
  }
}

bool Engine::IsOpen() const {
  return db_ && db_->IsOpen();
}

void Engine::EmitMetrics() {
  if (!IsOpen()) return;
  db_->EmitCacheMetrics();

  const auto& sink = opt_.metrics;
  if (!sink) return;

  CacheStats cs = records_->GetCacheStats();
  sink->Gauge("sessionvault.records.cache.size_bytes", static_cast<double>(cs.size_bytes));
  sink->Gauge("sessionvault.records.cache.items", static_cast<double>(cs.items));
  sink->Gauge("sessionvault.records.cache.hit_rate", cs.hit_rate);

  QueueStats qs = queue_->GetStats();
  sink->Gauge("sessionvault.queue.pending", static_cast<double>(qs.pending));
  sink->Gauge("sessionvault.queue.processing", static_cast<double>(qs.processing));
}

}  // namespace sessionvault

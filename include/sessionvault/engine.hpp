#pragma once

#include <memory>
#include <string>

#include <rocksdb/status.h>

#include <sessionvault/backend.hpp>
#include <sessionvault/clock.hpp>
#include <sessionvault/content_store.hpp>
#include <sessionvault/database.hpp>
#include <sessionvault/metrics.hpp>
#include <sessionvault/record_store.hpp>
#include <sessionvault/write_queue.hpp>

namespace sessionvault {

struct EngineOptions {
  DatabaseOptions database;
  ContentStoreOptions content;
  WriteQueueOptions queue;
  RecordStoreOptions records;

  // Start the write queue workers on open. With false, writes accumulate
  // until queue().Start() is called.
  bool start_queue = true;

  // Applied to every component that does not set its own.
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Clock> clock;
};

/**
 * sessionvault::Engine
 *
 * Owns one fully wired storage engine: the Database, the RocksBackend over
 * its record column family, the ContentStore, the WriteQueue and the
 * RecordStore composing them. Components are reached through accessors;
 * there is no process-wide instance.
 */
class Engine {
 public:
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<Engine>* out,
                              EngineOptions opt = EngineOptions{});

  /** Drain the write queue, then close the database. Safe to call multiple times. */
  void Shutdown();

  bool IsOpen() const;

  Database& database() { return *db_; }
  Backend& backend() { return *backend_; }
  ContentStore& content() { return *content_; }
  WriteQueue& queue() { return *queue_; }
  RecordStore& records() { return *records_; }

  /** Block cache metrics plus point-in-time gauges for the record cache and queue. */
  void EmitMetrics();

 private:
  explicit Engine(EngineOptions opt);

  EngineOptions opt_;

  // Declaration order is teardown order in reverse.
  std::unique_ptr<Database> db_;
  std::unique_ptr<RocksBackend> backend_;
  std::unique_ptr<ContentStore> content_;
  std::unique_ptr<WriteQueue> queue_;
  std::unique_ptr<RecordStore> records_;
};

}  // namespace sessionvault

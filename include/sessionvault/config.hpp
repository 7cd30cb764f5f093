#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <sessionvault/engine.hpp>

namespace sessionvault {

/**
 * Hot-record cache configuration.
 */
struct CacheConfig {
  uint64_t max_size_bytes = 100ull * 1024ull * 1024ull;
  uint64_t max_items = 0;  // 0 = unbounded
  uint64_t ttl_ms = 5 * 60 * 1000;
};

/**
 * Write queue configuration.
 */
struct QueueConfig {
  uint64_t max_size = 1000;
  uint64_t normal_interval_ms = 100;
  uint64_t low_idle_interval_ms = 500;
  uint64_t low_batch_size = 10;
  uint64_t retry_base_delay_ms = 100;
  int max_retries_critical = 1;
  int max_retries_normal = 3;
  int max_retries_low = 5;
};

/**
 * Content store and database configuration.
 */
struct ContentConfig {
  uint64_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int lock_timeout_ms = 2000;
  int max_txn_retries = 16;
  uint64_t metadata_cache_bytes = 8ull * 1024ull * 1024ull;
  uint64_t gc_progress_interval = 100;
  bool sync_writes = false;
};

/**
 * Settings read by the external compression collaborator. The engine only
 * carries and validates them.
 */
struct CompressionConfig {
  uint32_t age_threshold_days = 7;
  uint32_t max_cpu_percent = 50;
};

/**
 * Complete engine configuration.
 */
struct Config {
  std::string db_path;
  std::string log_level = "info";
  CacheConfig cache;
  QueueConfig queue;
  ContentConfig content;
  CompressionConfig compression;

  // Non-option command-line arguments, in order.
  std::vector<std::string> args;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments. Values given on the
   * command line override those from --config.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  EngineOptions ToEngineOptions() const;
};

}  // namespace sessionvault

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <rocksdb/status.h>

namespace sessionvault {

class Database;

/** One mutation in a Backend::Write batch. */
struct WriteOp {
  enum class Kind { kPut, kDelete };

  Kind kind = Kind::kPut;
  std::string key;
  std::string value;  // ignored for kDelete

  static WriteOp Put(std::string key, std::string value) {
    return WriteOp{Kind::kPut, std::move(key), std::move(value)};
  }
  static WriteOp Delete(std::string key) {
    return WriteOp{Kind::kDelete, std::move(key), std::string()};
  }
};

/**
 * Durable key/value medium behind WriteQueue and RecordStore.
 *
 * Implementations must be safe for concurrent use. A missing key is
 * Status::NotFound from Get; Delete of a missing key is OK.
 */
class Backend {
 public:
  virtual ~Backend() = default;

  virtual rocksdb::Status Put(std::string_view key, std::string_view value) = 0;
  virtual rocksdb::Status Get(std::string_view key, std::string* value) = 0;
  virtual rocksdb::Status Delete(std::string_view key) = 0;

  /** Apply every op or none of them. */
  virtual rocksdb::Status Write(const std::vector<WriteOp>& ops) = 0;

  /** All (key, value) pairs whose key starts with prefix, in key order. */
  virtual rocksdb::Status Scan(std::string_view prefix,
                               std::vector<std::pair<std::string, std::string>>* out) = 0;
};

/**
 * Backend over the sv_records column family of a Database.
 * The Database must outlive the backend.
 */
class RocksBackend : public Backend {
 public:
  explicit RocksBackend(Database* db);

  rocksdb::Status Put(std::string_view key, std::string_view value) override;
  rocksdb::Status Get(std::string_view key, std::string* value) override;
  rocksdb::Status Delete(std::string_view key) override;
  rocksdb::Status Write(const std::vector<WriteOp>& ops) override;
  rocksdb::Status Scan(std::string_view prefix,
                       std::vector<std::pair<std::string, std::string>>* out) override;

 private:
  Database* db_;
};

}  // namespace sessionvault

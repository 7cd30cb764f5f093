#include <sessionvault/backend.hpp>

#include <memory>

#include <rocksdb/iterator.h>
#include <rocksdb/write_batch.h>

#include <sessionvault/database.hpp>

namespace sessionvault {

RocksBackend::RocksBackend(Database* db) : db_(db) {}

rocksdb::Status RocksBackend::Put(std::string_view key, std::string_view value) {
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  return db_->db()->Put(db_->write_options(), db_->records_cf(),
                        rocksdb::Slice(key.data(), key.size()),
                        rocksdb::Slice(value.data(), value.size()));
}

rocksdb::Status RocksBackend::Get(std::string_view key, std::string* value) {
  if (!value) return rocksdb::Status::InvalidArgument("value is null");
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  return db_->db()->Get(rocksdb::ReadOptions(), db_->records_cf(),
                        rocksdb::Slice(key.data(), key.size()), value);
}

rocksdb::Status RocksBackend::Delete(std::string_view key) {
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  return db_->db()->Delete(db_->write_options(), db_->records_cf(),
                           rocksdb::Slice(key.data(), key.size()));
}

rocksdb::Status RocksBackend::Write(const std::vector<WriteOp>& ops) {
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  if (ops.empty()) return rocksdb::Status::OK();

  rocksdb::WriteBatch batch;
  for (const auto& op : ops) {
    rocksdb::Status s;
    if (op.kind == WriteOp::Kind::kPut) {
      s = batch.Put(db_->records_cf(), rocksdb::Slice(op.key), rocksdb::Slice(op.value));
    } else {
      s = batch.Delete(db_->records_cf(), rocksdb::Slice(op.key));
    }
    if (!s.ok()) return s;
  }
  // TransactionDB::Write takes the same key locks a transaction would.
  return db_->db()->Write(db_->write_options(), &batch);
}

rocksdb::Status RocksBackend::Scan(std::string_view prefix,
                                   std::vector<std::pair<std::string, std::string>>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!db_ || !db_->IsOpen()) return rocksdb::Status::InvalidArgument("database is not open");
  out->clear();

  std::unique_ptr<rocksdb::Iterator> it(
      db_->db()->NewIterator(rocksdb::ReadOptions(), db_->records_cf()));
  const rocksdb::Slice p(prefix.data(), prefix.size());
  for (it->Seek(p); it->Valid() && it->key().starts_with(p); it->Next()) {
    out->emplace_back(it->key().ToString(), it->value().ToString());
  }
  return it->status();
}

}  // namespace sessionvault

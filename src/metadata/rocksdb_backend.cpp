// ================================
// RocksDB 元数据后端实现
// ================================

#include "cirrus/metadata/rocksdb_backend.h"
#include "cirrus/common/logger.h"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>
#include <rocksdb/cache.h>
#include <rocksdb/write_batch.h>

namespace cirrus::metadata {

Result<std::unique_ptr<RocksDBBackend>> RocksDBBackend::Open(const Config& config) {
    rocksdb::Options options;
    options.create_if_missing = config.create_if_missing;
    options.OptimizeLevelStyleCompaction();
    options.IncreaseParallelism(4);

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config.cache_size);
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    rocksdb::DB* raw = nullptr;
    auto status = rocksdb::DB::Open(options, config.db_path, &raw);
    if (!status.ok()) {
        LOG_ERROR("Failed to open RocksDB: {}", status.ToString());
        return Err<std::unique_ptr<RocksDBBackend>>(
            ErrorCode::kIOError, "Failed to open RocksDB: " + status.ToString());
    }

    LOG_INFO("RocksDB initialized: {}", config.db_path);
    return std::unique_ptr<RocksDBBackend>(
        new RocksDBBackend(std::unique_ptr<rocksdb::DB>(raw)));
}

RocksDBBackend::RocksDBBackend(std::unique_ptr<rocksdb::DB> db)
    : db_(std::move(db)) {}

RocksDBBackend::~RocksDBBackend() = default;

Result<std::string> RocksDBBackend::Get(const std::string& key) {
    std::string value;
    auto status = db_->Get(rocksdb::ReadOptions(), key, &value);
    if (status.IsNotFound()) {
        return Err<std::string>(ErrorCode::kNotFound, key);
    }
    if (!status.ok()) {
        LOG_ERROR("RocksDB get failed: {}", status.ToString());
        return Err<std::string>(ErrorCode::kIOError, "RocksDB get failed: " + status.ToString());
    }
    return value;
}

Result<Void> RocksDBBackend::Write(const WriteBatch& batch) {
    rocksdb::WriteBatch wb;
    for (const auto& op : batch.ops()) {
        auto s = op.is_delete ? wb.Delete(op.key) : wb.Put(op.key, op.value);
        if (!s.ok()) {
            return Err<Void>(ErrorCode::kIOError, "RocksDB batch build failed: " + s.ToString());
        }
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = true;
    auto status = db_->Write(write_options, &wb);
    if (!status.ok()) {
        LOG_ERROR("RocksDB write failed: {}", status.ToString());
        return Err<Void>(ErrorCode::kIOError, "RocksDB write failed: " + status.ToString());
    }
    return Ok();
}

Result<std::vector<std::pair<std::string, std::string>>> RocksDBBackend::Scan(
    const std::string& prefix, size_t limit) {
    std::vector<std::pair<std::string, std::string>> result;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));

    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (result.size() >= limit) break;
        result.emplace_back(it->key().ToString(), it->value().ToString());
    }
    if (!it->status().ok()) {
        LOG_ERROR("RocksDB scan failed: {}", it->status().ToString());
        return Err<std::vector<std::pair<std::string, std::string>>>(
            ErrorCode::kIOError, "RocksDB scan failed: " + it->status().ToString());
    }
    return result;
}

void RegisterRocksDBBackend() {
    MetadataBackendFactory::Instance().Register("rocksdb",
        [](const std::string& path) -> Result<std::unique_ptr<MetadataBackend>> {
            auto opened = RocksDBBackend::Open(RocksDBBackend::Config{path});
            if (opened.hasError()) return opened.error();
            return std::unique_ptr<MetadataBackend>(std::move(opened).value());
        });
}

} // namespace cirrus::metadata

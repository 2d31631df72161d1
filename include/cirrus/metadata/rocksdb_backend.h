// RocksDB 元数据后端
#pragma once

#include "cirrus/metadata/metadata_backend.h"
#include <cstdint>
#include <memory>
#include <string>

namespace rocksdb {
class DB;
}

namespace cirrus::metadata {

class RocksDBBackend : public MetadataBackend {
public:
    struct Config {
        std::string db_path;
        bool create_if_missing = true;
        uint64_t cache_size = 64ULL << 20;
    };

    static Result<std::unique_ptr<RocksDBBackend>> Open(const Config& config);

    ~RocksDBBackend() override;

    Result<std::string> Get(const std::string& key) override;
    Result<Void> Write(const WriteBatch& batch) override;
    Result<std::vector<std::pair<std::string, std::string>>> Scan(
        const std::string& prefix, size_t limit) override;

private:
    explicit RocksDBBackend(std::unique_ptr<rocksdb::DB> db);

    std::unique_ptr<rocksdb::DB> db_;
};

// 向 MetadataBackendFactory 注册 "rocksdb"，配置字符串即数据库路径
void RegisterRocksDBBackend();

} // namespace cirrus::metadata

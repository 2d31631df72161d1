#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "cirrus/common/result.h"

namespace cirrus::metadata {

// ================================
// WriteBatch - 原子提交的一组 Put/Delete
// ================================
class WriteBatch {
public:
    struct Op {
        bool is_delete;
        std::string key;
        std::string value;
    };

    void Put(std::string key, std::string value) {
        ops_.push_back({false, std::move(key), std::move(value)});
    }
    void Delete(std::string key) {
        ops_.push_back({true, std::move(key), {}});
    }

    const std::vector<Op>& ops() const { return ops_; }
    bool empty() const { return ops_.empty(); }

private:
    std::vector<Op> ops_;
};

// ================================
// MetadataBackend - 有序 KV 存储
// ================================
class MetadataBackend {
public:
    virtual ~MetadataBackend() = default;

    // key 不存在时返回 kNotFound
    virtual Result<std::string> Get(const std::string& key) = 0;

    // 全部成功或全部失败。返回后，之后的 Get 都能看到这批写入
    virtual Result<Void> Write(const WriteBatch& batch) = 0;

    // 按 key 顺序返回以 prefix 开头的条目，最多 limit 条
    virtual Result<std::vector<std::pair<std::string, std::string>>> Scan(
        const std::string& prefix, size_t limit) = 0;
};

// ================================
// 内存后端
// ================================
class MemoryMetadataBackend : public MetadataBackend {
public:
    MemoryMetadataBackend();
    ~MemoryMetadataBackend() override;

    Result<std::string> Get(const std::string& key) override;
    Result<Void> Write(const WriteBatch& batch) override;
    Result<std::vector<std::pair<std::string, std::string>>> Scan(
        const std::string& prefix, size_t limit) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// ================================
// 后端工厂
// ================================
class MetadataBackendFactory {
public:
    // 参数由后端自行解释：rocksdb 为数据库路径
    using Creator = std::function<Result<std::unique_ptr<MetadataBackend>>(const std::string&)>;

    static MetadataBackendFactory& Instance() {
        static MetadataBackendFactory instance;
        return instance;
    }

    void Register(const std::string& type, Creator creator) {
        creators_[type] = std::move(creator);
    }

    Result<std::unique_ptr<MetadataBackend>> Create(const std::string& type,
                                                    const std::string& config) {
        auto it = creators_.find(type);
        if (it == creators_.end()) {
            return Err<std::unique_ptr<MetadataBackend>>(
                ErrorCode::kInvalidArgument, "Unknown metadata backend: " + type);
        }
        return it->second(config);
    }

private:
    std::map<std::string, Creator> creators_;
};

void RegisterMemoryBackend();

} // namespace cirrus::metadata

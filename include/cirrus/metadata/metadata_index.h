#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cirrus/common/result.h"
#include "cirrus/metadata/metadata_backend.h"
#include "cirrus/metadata/object_meta.h"

namespace cirrus::metadata {

// ================================
// MetadataIndex - (bucket, key[, version]) -> ObjectMeta
//
// 后端中的 key 布局:
//   B:{bucket}                      桶记录
//   O:{bucket}/{key}                当前 ObjectMeta
//   V:{bucket}/{key}\0{version_id}  历史 ObjectMeta（开启版本控制的桶）
//   V:{bucket}/{key}\0null          被带版本写入替换下来的无版本条目
//
// 桶名不含 '/'，前缀不会冲突
// ================================
class MetadataIndex {
public:
    explicit MetadataIndex(std::unique_ptr<MetadataBackend> backend);

    // === Buckets ===

    Result<BucketMeta> CreateBucket(const std::string& name);
    Result<BucketMeta> GetBucket(const std::string& name);
    // 仍有当前或历史对象时返回 kBucketNotEmpty
    Result<Void> DeleteBucket(const std::string& name);
    Result<BucketMeta> SetBucketVersioning(const std::string& name, VersioningState state);

    // === Objects ===

    // kNoSuchBucket / kNoSuchKey
    Result<ObjectMeta> Lookup(const std::string& bucket, const std::string& key);

    // 按版本查询，"null" 表示无版本条目。桶和 key 存在但版本不存在时
    // 返回 kNoSuchVersion
    Result<ObjectMeta> Lookup(const std::string& bucket, const std::string& key,
                              const std::string& version_id);

    struct CommitResult {
        ObjectMeta meta;                           // 落盘后的记录，已填入版本号
        std::optional<StorageLocation> orphaned;   // 索引中已无引用的位置
    };

    // 用一个原子批次把 meta 设为 (meta.bucket, meta.key) 的当前条目，
    // meta.version_id 在这里分配
    Result<CommitResult> Commit(ObjectMeta meta);

    struct RemoveResult {
        std::optional<StorageLocation> orphaned;
    };

    // 删除当前条目，已记录的历史版本仍可读
    Result<RemoveResult> Remove(const std::string& bucket, const std::string& key);

    static bool IsValidBucketName(const std::string& name);

private:
    std::unique_ptr<MetadataBackend> backend_;
    // 串行化写路径上的读-改-写，读路径不加锁
    std::mutex write_mutex_;

    static constexpr const char* kNullVersion = "null";

    static std::string BucketKey(const std::string& name) { return "B:" + name; }
    static std::string ObjectKey(const std::string& bucket, const std::string& key) {
        return "O:" + bucket + "/" + key;
    }
    static std::string VersionKey(const std::string& bucket, const std::string& key,
                                  const std::string& version_id) {
        std::string k = "V:" + bucket + "/" + key;
        k.push_back('\0');
        k.append(version_id);
        return k;
    }

    Result<std::optional<ObjectMeta>> ReadObject(const std::string& backend_key);
    std::string NewVersionId();
};

} // namespace cirrus::metadata

// ================================
// 基于 KV 后端的元数据索引
// ================================

#include "cirrus/metadata/metadata_index.h"
#include "cirrus/common/digest.h"
#include "cirrus/common/logger.h"
#include "cirrus/common/result_macros.h"
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace cirrus::metadata {

MetadataIndex::MetadataIndex(std::unique_ptr<MetadataBackend> backend)
    : backend_(std::move(backend)) {}

bool MetadataIndex::IsValidBucketName(const std::string& name) {
    if (name.size() < 3 || name.size() > 63) return false;
    for (char c : name) {
        auto u = static_cast<unsigned char>(c);
        if (!(std::islower(u) || std::isdigit(u) || c == '-' || c == '.')) return false;
    }
    return std::isalnum(static_cast<unsigned char>(name.front())) &&
           std::isalnum(static_cast<unsigned char>(name.back()));
}

std::string MetadataIndex::NewVersionId() {
    // 毫秒前缀让同一 key 的版本号大致按写入顺序排列
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(12) << ms << RandomHex(8);
    return ss.str();
}

// ================================
// 桶操作
// ================================

Result<BucketMeta> MetadataIndex::CreateBucket(const std::string& name) {
    if (!IsValidBucketName(name)) {
        return Err<BucketMeta>(ErrorCode::kInvalidArgument, "Invalid bucket name: " + name);
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto existing = backend_->Get(BucketKey(name));
    if (existing.hasValue()) {
        return Err<BucketMeta>(ErrorCode::kBucketAlreadyExists, name);
    }
    if (existing.code() != ErrorCode::kNotFound) return existing.error();

    BucketMeta meta;
    meta.name = name;
    meta.creation_time = NowInSeconds();

    WriteBatch batch;
    batch.Put(BucketKey(name), meta.Encode());
    RETURN_ON_ERROR(backend_->Write(batch));

    LOG_INFO("Created bucket {}", name);
    return meta;
}

Result<BucketMeta> MetadataIndex::GetBucket(const std::string& name) {
    auto value = backend_->Get(BucketKey(name));
    if (value.hasError()) {
        if (value.code() == ErrorCode::kNotFound) {
            return Err<BucketMeta>(ErrorCode::kNoSuchBucket, name);
        }
        return value.error();
    }
    auto meta = BucketMeta::Decode(value.value());
    if (meta.hasError()) {
        LOG_ERROR("Corrupt bucket record for {}", name);
    }
    return meta;
}

Result<Void> MetadataIndex::DeleteBucket(const std::string& name) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    RETURN_ON_ERROR(GetBucket(name));

    for (const char* kind : {"O:", "V:"}) {
        ASSIGN_OR_RETURN(auto entries, backend_->Scan(kind + name + "/", 1));
        if (!entries.empty()) {
            return Err<Void>(ErrorCode::kBucketNotEmpty, name);
        }
    }

    WriteBatch batch;
    batch.Delete(BucketKey(name));
    RETURN_ON_ERROR(backend_->Write(batch));
    LOG_INFO("Deleted bucket {}", name);
    return Ok();
}

Result<BucketMeta> MetadataIndex::SetBucketVersioning(const std::string& name,
                                                      VersioningState state) {
    if (state == VersioningState::kUnversioned) {
        return Err<BucketMeta>(ErrorCode::kInvalidArgument,
                               "Versioning can only be enabled or suspended");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    ASSIGN_OR_RETURN(auto meta, GetBucket(name));
    meta.versioning = state;

    WriteBatch batch;
    batch.Put(BucketKey(name), meta.Encode());
    RETURN_ON_ERROR(backend_->Write(batch));
    return meta;
}

// ================================
// 对象操作
// ================================

Result<std::optional<ObjectMeta>> MetadataIndex::ReadObject(const std::string& backend_key) {
    auto value = backend_->Get(backend_key);
    if (value.hasError()) {
        if (value.code() == ErrorCode::kNotFound) return std::optional<ObjectMeta>();
        return value.error();
    }
    auto meta = ObjectMeta::Decode(value.value());
    if (meta.hasError()) {
        LOG_ERROR("Corrupt object record under {}", backend_key);
        return meta.error();
    }
    return std::optional<ObjectMeta>(std::move(meta).value());
}

Result<ObjectMeta> MetadataIndex::Lookup(const std::string& bucket, const std::string& key) {
    RETURN_ON_ERROR(GetBucket(bucket));

    ASSIGN_OR_RETURN(auto found, ReadObject(ObjectKey(bucket, key)));
    if (!found) {
        return Err<ObjectMeta>(ErrorCode::kNoSuchKey, key);
    }
    return std::move(*found);
}

Result<ObjectMeta> MetadataIndex::Lookup(const std::string& bucket, const std::string& key,
                                         const std::string& version_id) {
    if (version_id.empty()) return Lookup(bucket, key);
    RETURN_ON_ERROR(GetBucket(bucket));

    if (version_id == kNullVersion) {
        ASSIGN_OR_RETURN(auto current, ReadObject(ObjectKey(bucket, key)));
        if (current && current->version_id.empty()) return std::move(*current);
        // 已被带版本写入替换
        ASSIGN_OR_RETURN(auto kept, ReadObject(VersionKey(bucket, key, kNullVersion)));
        if (kept) return std::move(*kept);
        if (!current) return Err<ObjectMeta>(ErrorCode::kNoSuchKey, key);
        return Err<ObjectMeta>(ErrorCode::kNoSuchVersion, version_id);
    }

    ASSIGN_OR_RETURN(auto found, ReadObject(VersionKey(bucket, key, version_id)));
    if (found) return std::move(*found);

    // 区分 key 不存在和版本不存在
    ASSIGN_OR_RETURN(auto current, ReadObject(ObjectKey(bucket, key)));
    if (!current) {
        ASSIGN_OR_RETURN(auto versions,
                         backend_->Scan(VersionKey(bucket, key, ""), 1));
        if (versions.empty()) return Err<ObjectMeta>(ErrorCode::kNoSuchKey, key);
    }
    return Err<ObjectMeta>(ErrorCode::kNoSuchVersion, version_id);
}

Result<MetadataIndex::CommitResult> MetadataIndex::Commit(ObjectMeta meta) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    ASSIGN_OR_RETURN(auto bucket, GetBucket(meta.bucket));
    ASSIGN_OR_RETURN(auto previous, ReadObject(ObjectKey(meta.bucket, meta.key)));

    CommitResult result;
    WriteBatch batch;

    if (bucket.versioning == VersioningState::kEnabled) {
        meta.version_id = NewVersionId();
        batch.Put(VersionKey(meta.bucket, meta.key, meta.version_id), meta.Encode());
        // 原无版本条目成为 "null" 版本
        if (previous && previous->version_id.empty()) {
            batch.Put(VersionKey(meta.bucket, meta.key, kNullVersion), previous->Encode());
        }
    } else {
        meta.version_id.clear();
        // 新条目替换 "null" 版本，无论它当前存在何处
        if (previous && previous->version_id.empty()) {
            if (previous->location != meta.location) result.orphaned = previous->location;
        } else if (bucket.versioning == VersioningState::kSuspended) {
            auto null_key = VersionKey(meta.bucket, meta.key, kNullVersion);
            ASSIGN_OR_RETURN(auto kept, ReadObject(null_key));
            if (kept) {
                batch.Delete(null_key);
                if (kept->location != meta.location) result.orphaned = kept->location;
            }
        }
    }

    batch.Put(ObjectKey(meta.bucket, meta.key), meta.Encode());
    RETURN_ON_ERROR(backend_->Write(batch));

    LOG_DEBUG("Committed {}/{} size={} etag={} version={}",
              meta.bucket, meta.key, meta.size, meta.etag,
              meta.version_id.empty() ? "null" : meta.version_id);
    result.meta = std::move(meta);
    return result;
}

Result<MetadataIndex::RemoveResult> MetadataIndex::Remove(const std::string& bucket,
                                                          const std::string& key) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    ASSIGN_OR_RETURN(auto bucket_meta, GetBucket(bucket));
    ASSIGN_OR_RETURN(auto current, ReadObject(ObjectKey(bucket, key)));

    RemoveResult result;
    if (!current) return result;

    WriteBatch batch;
    batch.Delete(ObjectKey(bucket, key));
    bool keep_null = current->version_id.empty() &&
                     bucket_meta.versioning == VersioningState::kEnabled;
    if (keep_null) {
        batch.Put(VersionKey(bucket, key, kNullVersion), current->Encode());
    }
    RETURN_ON_ERROR(backend_->Write(batch));

    if (current->version_id.empty() && !keep_null) {
        result.orphaned = current->location;
    }
    LOG_DEBUG("Removed {}/{}", bucket, key);
    return result;
}

} // namespace cirrus::metadata

#pragma once

#include <memory>
#include <string>
#include "cirrus/common/digest.h"
#include "cirrus/common/result.h"
#include "cirrus/common/types.h"
#include "cirrus/metadata/metadata_index.h"
#include "cirrus/retrieval/conditional.h"
#include "cirrus/storage/object_store.h"

namespace cirrus::retrieval {

struct GetObjectRequest {
    std::string bucket;
    std::string key;
    std::string version_id;     // 为空表示当前版本
    HeaderMap headers;
    bool head_only = false;     // HEAD: 只做判定，不打开 body
};

// ================================
// ObjectResponse - 交给编码器的响应描述
// ================================
struct ObjectResponse {
    Decision decision;
    metadata::ObjectMeta meta;
    ByteRange range;                            // body 携带的字节范围
    std::unique_ptr<storage::ByteStream> body;  // HEAD 和无 body 的结果为空
};

// ================================
// VerifyingStream - 内容与元数据不符时拒绝完成 body
//
// 内层流提前结束或多出数据时返回 kIntegrityError。带期望 MD5 时
// (整对象读取)，最后一块在摘要校验通过后才交出
// ================================
class VerifyingStream : public storage::ByteStream {
public:
    VerifyingStream(std::unique_ptr<storage::ByteStream> inner, uint64_t expected_length,
                    std::string expected_md5, std::string description);

    Result<std::string> Read(size_t max_bytes) override;
    uint64_t Remaining() const override { return expected_ - delivered_; }

private:
    std::unique_ptr<storage::ByteStream> inner_;
    uint64_t expected_;
    uint64_t delivered_ = 0;
    std::string expected_md5_;
    std::unique_ptr<Md5Hasher> hasher_;
    std::string description_;
    bool failed_ = false;

    Result<std::string> Fail(const std::string& why);
};

// ================================
// RetrievalEngine - GetObject 核心流程
//
// 调用之间无状态，可跨线程共享
// ================================
class RetrievalEngine {
public:
    RetrievalEngine(std::shared_ptr<metadata::MetadataIndex> index,
                    std::shared_ptr<storage::ObjectStore> store);

    // Errors: kNoSuchBucket, kNoSuchKey, kNoSuchVersion, kIntegrityError,
    // kIOError. 304/412/416 are decisions, not errors.
    Result<ObjectResponse> Get(const GetObjectRequest& request) const;

    // ETag 是否为单段 MD5 摘要形式
    static bool IsMd5Etag(const std::string& etag);

private:
    std::shared_ptr<metadata::MetadataIndex> index_;
    std::shared_ptr<storage::ObjectStore> store_;

    Result<metadata::ObjectMeta> Resolve(const GetObjectRequest& request) const;
    Result<std::unique_ptr<storage::ByteStream>> OpenBody(const metadata::ObjectMeta& meta,
                                                          const ByteRange& range) const;
};

} // namespace cirrus::retrieval

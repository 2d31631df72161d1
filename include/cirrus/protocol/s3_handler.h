// S3 操作处理器
#pragma once

#include <memory>
#include <string>
#include "cirrus/metadata/metadata_index.h"
#include "cirrus/protocol/authorizer.h"
#include "cirrus/protocol/response_encoder.h"
#include "cirrus/protocol/s3_router.h"
#include "cirrus/protocol/s3_types.h"
#include "cirrus/retrieval/retrieval_engine.h"
#include "cirrus/storage/object_store.h"

namespace cirrus {
namespace s3 {

class S3Handler {
public:
    struct Options {
        std::string default_content_type = "binary/octet-stream";
    };

    S3Handler(std::shared_ptr<metadata::MetadataIndex> index,
              std::shared_ptr<storage::ObjectStore> store,
              std::shared_ptr<Authorizer> authorizer,
              Options options);

    S3Handler(std::shared_ptr<metadata::MetadataIndex> index,
              std::shared_ptr<storage::ObjectStore> store)
        : S3Handler(std::move(index), std::move(store),
                    std::make_shared<AllowAllAuthorizer>(), Options{}) {}

    // 路由、鉴权并处理一个请求，所有响应都带 x-amz-request-id
    // GetObject 的 body 以流的形式返回
    S3Response Handle(S3Request& req);

private:
    std::shared_ptr<metadata::MetadataIndex> index_;
    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<Authorizer> authorizer_;
    retrieval::RetrievalEngine engine_;
    ResponseEncoder encoder_;
    Options options_;

    S3Response Dispatch(S3Request& req, const ErrorContext& ctx);

    // ========== Bucket ==========
    S3Response HandleCreateBucket(const S3Request& req, const ErrorContext& ctx);
    S3Response HandleDeleteBucket(const S3Request& req, const ErrorContext& ctx);
    S3Response HandleHeadBucket(const S3Request& req, const ErrorContext& ctx);
    S3Response HandlePutBucketVersioning(const S3Request& req, const ErrorContext& ctx);

    // ========== Object ==========
    S3Response HandleGetObject(const S3Request& req, const ErrorContext& ctx, bool head_only);
    S3Response HandlePutObject(const S3Request& req, const ErrorContext& ctx);
    S3Response HandleDeleteObject(const S3Request& req, const ErrorContext& ctx);

    S3Response Error(const Status& status, const ErrorContext& ctx);
    S3Response Empty(int status_code, const ErrorContext& ctx);
    // 尽力回收已无引用的 blob
    void Reclaim(const StorageLocation& location);
};

} // namespace s3
} // namespace cirrus

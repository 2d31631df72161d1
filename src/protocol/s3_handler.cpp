// ================================
// S3 操作处理
// ================================

#include "cirrus/protocol/s3_handler.h"
#include "cirrus/common/digest.h"
#include "cirrus/common/logger.h"
#include <algorithm>
#include <cctype>

namespace cirrus {
namespace s3 {

namespace {

// 随对象保存并在 GET 时返回的表示头
const char* const kStoredHeaders[] = {
    "Cache-Control", "Content-Disposition", "Content-Encoding", "Content-Language", "Expires",
};

const std::string kUserMetaPrefix = "x-amz-meta-";

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// <VersioningConfiguration><Status>Enabled</Status></VersioningConfiguration>
std::string VersioningStatusOf(const std::string& body) {
    auto open = body.find("<Status>");
    if (open == std::string::npos) return "";
    open += 8;
    auto close = body.find("</Status>", open);
    if (close == std::string::npos) return "";
    return body.substr(open, close - open);
}

} // namespace

S3Handler::S3Handler(std::shared_ptr<metadata::MetadataIndex> index,
                     std::shared_ptr<storage::ObjectStore> store,
                     std::shared_ptr<Authorizer> authorizer,
                     Options options)
    : index_(std::move(index)),
      store_(std::move(store)),
      authorizer_(std::move(authorizer)),
      engine_(index_, store_),
      encoder_(options.default_content_type),
      options_(std::move(options)) {}

S3Response S3Handler::Handle(S3Request& req) {
    S3Router::ParseRequest(req);

    ErrorContext ctx;
    ctx.bucket = req.bucket_name;
    ctx.key = req.object_key;
    ctx.resource = req.Resource();
    ctx.request_id = NewRequestId();

    LOG_DEBUG("[{}] {} {} -> {}", ctx.request_id, req.method, req.uri, S3OpName(req.op));

    S3Response resp;
    if (!authorizer_->Authorize(req)) {
        resp = ResponseEncoder::EncodeError(S3Error::AccessDenied(), ctx);
    } else {
        resp = Dispatch(req, ctx);
    }

    if (req.method == "HEAD") {
        resp.DropPayload();
    }
    LOG_DEBUG("[{}] {} {} -> {}", ctx.request_id, req.method, req.uri, resp.status_code);
    return resp;
}

S3Response S3Handler::Dispatch(S3Request& req, const ErrorContext& ctx) {
    switch (req.op) {
        case S3Op::CREATE_BUCKET:         return HandleCreateBucket(req, ctx);
        case S3Op::DELETE_BUCKET:         return HandleDeleteBucket(req, ctx);
        case S3Op::HEAD_BUCKET:           return HandleHeadBucket(req, ctx);
        case S3Op::PUT_BUCKET_VERSIONING: return HandlePutBucketVersioning(req, ctx);
        case S3Op::GET_OBJECT:            return HandleGetObject(req, ctx, false);
        case S3Op::HEAD_OBJECT:           return HandleGetObject(req, ctx, true);
        case S3Op::PUT_OBJECT:            return HandlePutObject(req, ctx);
        case S3Op::DELETE_OBJECT:         return HandleDeleteObject(req, ctx);
        case S3Op::UNSUPPORTED:
            return ResponseEncoder::EncodeError(S3Error::NotImplemented(), ctx);
        case S3Op::UNKNOWN:
            break;
    }
    S3Error err{405, "MethodNotAllowed", "The specified method is not allowed against this resource."};
    return ResponseEncoder::EncodeError(err, ctx);
}

S3Response S3Handler::Error(const Status& status, const ErrorContext& ctx) {
    auto err = S3Error::FromStatus(status);
    if (err.http_status >= 500) {
        LOG_ERROR("[{}] {} failed: {}", ctx.request_id, ctx.resource, status.ToString());
    }
    return ResponseEncoder::EncodeError(err, ctx);
}

S3Response S3Handler::Empty(int status_code, const ErrorContext& ctx) {
    S3Response resp;
    resp.status_code = status_code;
    resp.headers["x-amz-request-id"] = ctx.request_id;
    resp.headers["Content-Length"] = "0";
    return resp;
}

void S3Handler::Reclaim(const StorageLocation& location) {
    auto res = store_->Remove(location);
    if (res.hasError()) {
        LOG_WARN("Failed to reclaim blob {}: {}", location, res.error().ToString());
    }
}

// ========== Bucket ==========

S3Response S3Handler::HandleCreateBucket(const S3Request& req, const ErrorContext& ctx) {
    auto res = index_->CreateBucket(req.bucket_name);
    if (res.hasError()) {
        if (res.code() == ErrorCode::kInvalidArgument) {
            return ResponseEncoder::EncodeError(
                S3Error{400, "InvalidBucketName", "The specified bucket is not valid."}, ctx);
        }
        return Error(res.error(), ctx);
    }
    auto resp = Empty(200, ctx);
    resp.headers["Location"] = "/" + req.bucket_name;
    return resp;
}

S3Response S3Handler::HandleDeleteBucket(const S3Request& req, const ErrorContext& ctx) {
    auto res = index_->DeleteBucket(req.bucket_name);
    if (res.hasError()) return Error(res.error(), ctx);
    return Empty(204, ctx);
}

S3Response S3Handler::HandleHeadBucket(const S3Request& req, const ErrorContext& ctx) {
    auto res = index_->GetBucket(req.bucket_name);
    if (res.hasError()) return Error(res.error(), ctx);
    return Empty(200, ctx);
}

S3Response S3Handler::HandlePutBucketVersioning(const S3Request& req, const ErrorContext& ctx) {
    auto status = VersioningStatusOf(req.body);
    metadata::VersioningState state;
    if (status == "Enabled") {
        state = metadata::VersioningState::kEnabled;
    } else if (status == "Suspended") {
        state = metadata::VersioningState::kSuspended;
    } else {
        return ResponseEncoder::EncodeError(S3Error::MalformedXML(), ctx);
    }

    auto res = index_->SetBucketVersioning(req.bucket_name, state);
    if (res.hasError()) return Error(res.error(), ctx);
    LOG_INFO("Bucket {} versioning {}", req.bucket_name, status);
    return Empty(200, ctx);
}

// ========== Object ==========

S3Response S3Handler::HandleGetObject(const S3Request& req, const ErrorContext& ctx,
                                      bool head_only) {
    retrieval::GetObjectRequest get;
    get.bucket = req.bucket_name;
    get.key = req.object_key;
    get.version_id = req.GetParam("versionId");
    get.headers = req.headers;
    get.head_only = head_only;

    auto res = engine_.Get(get);
    if (res.hasError()) return Error(res.error(), ctx);
    return encoder_.Encode(std::move(res).value(), req.params, ctx);
}

S3Response S3Handler::HandlePutObject(const S3Request& req, const ErrorContext& ctx) {
    // 先检查桶，避免写入无人引用的 blob
    auto bucket = index_->GetBucket(req.bucket_name);
    if (bucket.hasError()) return Error(bucket.error(), ctx);

    metadata::ObjectMeta meta;
    meta.bucket = req.bucket_name;
    meta.key = req.object_key;
    meta.size = req.body.size();
    meta.etag = Md5Hex(req.body);
    meta.content_type = req.GetHeader("Content-Type");
    if (meta.content_type.empty()) meta.content_type = options_.default_content_type;
    meta.last_modified = NowInSeconds();

    for (const char* name : kStoredHeaders) {
        auto value = req.GetHeader(name);
        if (!value.empty()) meta.http_headers[name] = value;
    }
    for (const auto& [name, value] : req.headers) {
        auto lower = ToLower(name);
        if (lower.size() > kUserMetaPrefix.size() && lower.rfind(kUserMetaPrefix, 0) == 0) {
            meta.user_metadata[lower.substr(kUserMetaPrefix.size())] = value;
        }
    }

    auto location = store_->Write(req.body);
    if (location.hasError()) return Error(location.error(), ctx);
    meta.location = location.value();

    auto committed = index_->Commit(std::move(meta));
    if (committed.hasError()) {
        Reclaim(location.value());
        return Error(committed.error(), ctx);
    }
    if (committed.value().orphaned) {
        Reclaim(*committed.value().orphaned);
    }

    const auto& stored = committed.value().meta;
    auto resp = Empty(200, ctx);
    resp.headers["ETag"] = ResponseEncoder::QuoteEtag(stored.etag);
    if (!stored.version_id.empty()) {
        resp.headers["x-amz-version-id"] = stored.version_id;
    }
    return resp;
}

S3Response S3Handler::HandleDeleteObject(const S3Request& req, const ErrorContext& ctx) {
    auto res = index_->Remove(req.bucket_name, req.object_key);
    if (res.hasError()) return Error(res.error(), ctx);
    if (res.value().orphaned) {
        Reclaim(*res.value().orphaned);
    }
    return Empty(204, ctx);
}

} // namespace s3
} // namespace cirrus

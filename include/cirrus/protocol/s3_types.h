// ================================
// S3 请求/响应类型
// ================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include "cirrus/common/types.h"
#include "cirrus/storage/object_store.h"

namespace cirrus {
namespace s3 {

// 网关支持的 S3 操作
enum class S3Op {
    UNKNOWN,
    UNSUPPORTED,            // 合法的 S3 操作但不提供 (列举、分段上传)
    CREATE_BUCKET, DELETE_BUCKET, HEAD_BUCKET, PUT_BUCKET_VERSIONING,
    GET_OBJECT, HEAD_OBJECT, PUT_OBJECT, DELETE_OBJECT,
};

const char* S3OpName(S3Op op);

// S3 错误: HTTP 状态码 + 错误码和消息
struct S3Error {
    int http_status;
    std::string code;
    std::string message;

    static S3Error AccessDenied() { return {403, "AccessDenied", "Access Denied"}; }
    static S3Error NoSuchBucket() { return {404, "NoSuchBucket", "The specified bucket does not exist"}; }
    static S3Error NoSuchKey() { return {404, "NoSuchKey", "The specified key does not exist."}; }
    static S3Error NoSuchVersion() {
        return {404, "NoSuchVersion", "The specified version does not exist."};
    }
    static S3Error BucketAlreadyExists() {
        return {409, "BucketAlreadyExists", "The requested bucket name is not available."};
    }
    static S3Error BucketNotEmpty() {
        return {409, "BucketNotEmpty", "The bucket you tried to delete is not empty"};
    }
    static S3Error PreconditionFailed() {
        return {412, "PreconditionFailed", "At least one of the pre-conditions you specified did not hold"};
    }
    static S3Error InvalidRange() {
        return {416, "InvalidRange", "The requested range is not satisfiable"};
    }
    static S3Error InvalidArgument() { return {400, "InvalidArgument", "Invalid Argument"}; }
    static S3Error MalformedXML() {
        return {400, "MalformedXML", "The XML you provided was not well-formed"};
    }
    static S3Error NotImplemented() {
        return {501, "NotImplemented", "A header you provided implies functionality that is not implemented"};
    }
    static S3Error InternalError() {
        return {500, "InternalError", "We encountered an internal error. Please try again."};
    }

    // 内部 Status 到 S3 错误的映射
    static S3Error FromStatus(const Status& status);
};

// 解析后的 S3 请求
struct S3Request {
    std::string method;
    std::string uri;                // path, optionally followed by ?query
    std::string query_string;
    HeaderMap headers;
    std::string body;
    std::string bucket_name;
    std::string object_key;
    S3Op op = S3Op::UNKNOWN;
    std::map<std::string, std::string> params;

    std::string GetHeader(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : "";
    }
    std::string GetParam(const std::string& name) const {
        auto it = params.find(name);
        return it != params.end() ? it->second : "";
    }
    bool HasParam(const std::string& name) const { return params.count(name) > 0; }

    // "/bucket/key" without the query
    std::string Resource() const;
};

// S3 响应: payload 由 `body` 或 `stream` 携带
// Content-Length 总由生产方填写，HEAD 也一样 (此时两者都不发送)
struct S3Response {
    int status_code = 200;
    HeaderMap headers;
    std::string body;
    std::unique_ptr<storage::ByteStream> stream;

    S3Response() = default;
    S3Response(S3Response&&) = default;
    S3Response& operator=(S3Response&&) = default;
    S3Response(const S3Response&) = delete;
    S3Response& operator=(const S3Response&) = delete;

    void SetBody(std::string data, const std::string& content_type) {
        body = std::move(data);
        headers["Content-Type"] = content_type;
        headers["Content-Length"] = std::to_string(body.size());
    }

    // HEAD: 保留所有头，不发送 payload
    void DropPayload() {
        body.clear();
        stream.reset();
    }
};

// 流式 body 的写入目标，例如 socket 发送缓冲
class BodySink {
public:
    virtual ~BodySink() = default;
    // 无法再写入时返回 false
    virtual bool Write(std::string_view data) = 0;
};

} // namespace s3
} // namespace cirrus

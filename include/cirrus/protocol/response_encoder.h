#pragma once

#include <string>
#include <utility>
#include <vector>
#include "cirrus/protocol/s3_types.h"
#include "cirrus/retrieval/retrieval_engine.h"

namespace cirrus {
namespace s3 {

// 错误响应所针对的资源
struct ErrorContext {
    std::string bucket;
    std::string key;
    std::string resource;       // 请求路径
    std::string request_id;
};

enum class PumpStatus {
    kMore,      // 本轮额度用完，流中还有数据
    kDone,      // 流已读完，所有字节已交付
    kFailed,    // 流或 sink 出错，需中断连接
};

// ================================
// ResponseEncoder - ObjectResponse / errors -> S3Response
// ================================
class ResponseEncoder {
public:
    explicit ResponseEncoder(std::string default_content_type = "binary/octet-stream")
        : default_content_type_(std::move(default_content_type)) {}

    // 200/206 with headers and the body stream, 304 bare, 412/416 as errors.
    // `params` are the query parameters (response-* overrides).
    S3Response Encode(retrieval::ObjectResponse response,
                      const std::map<std::string, std::string>& params,
                      const ErrorContext& ctx) const;

    // S3 XML 错误文档，`extra` 元素放在 RequestId 之后
    static S3Response EncodeError(const S3Error& error, const ErrorContext& ctx,
                                  const std::vector<std::pair<std::string, std::string>>& extra = {});

    static std::string ErrorXml(const S3Error& error, const ErrorContext& ctx,
                                const std::vector<std::pair<std::string, std::string>>& extra);

    // 从 stream 向 sink 搬运最多 `budget` 字节
    static PumpStatus PumpBody(storage::ByteStream& stream, BodySink& sink, size_t budget);

    static std::string XmlEscape(const std::string& s);
    static std::string QuoteEtag(const std::string& etag) { return "\"" + etag + "\""; }

private:
    std::string default_content_type_;

    void AddObjectHeaders(const metadata::ObjectMeta& meta, S3Response& resp) const;
    static void ApplyOverrides(const std::map<std::string, std::string>& params, S3Response& resp);
};

} // namespace s3
} // namespace cirrus

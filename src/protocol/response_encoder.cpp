// ================================
// S3 响应编码
// ================================

#include "cirrus/protocol/response_encoder.h"
#include "cirrus/common/logger.h"
#include <sstream>

namespace cirrus {
namespace s3 {

namespace {

// 查询参数 -> 被覆盖的响应头
const std::pair<const char*, const char*> kResponseOverrides[] = {
    {"response-content-type", "Content-Type"},
    {"response-content-language", "Content-Language"},
    {"response-expires", "Expires"},
    {"response-cache-control", "Cache-Control"},
    {"response-content-disposition", "Content-Disposition"},
    {"response-content-encoding", "Content-Encoding"},
};

// 针对桶本身的错误，即使请求带 key 也返回 BucketName
bool IsBucketError(const std::string& code) {
    return code == "NoSuchBucket" || code == "BucketAlreadyExists" ||
           code == "BucketNotEmpty" || code == "InvalidBucketName";
}

std::string ContentRange(uint64_t first, uint64_t last, uint64_t total) {
    return "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" +
           std::to_string(total);
}

} // namespace

std::string ResponseEncoder::XmlEscape(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': r += "&amp;"; break;
            case '<': r += "&lt;"; break;
            case '>': r += "&gt;"; break;
            case '"': r += "&quot;"; break;
            case '\'': r += "&apos;"; break;
            default: r += c;
        }
    }
    return r;
}

std::string ResponseEncoder::ErrorXml(const S3Error& error, const ErrorContext& ctx,
                                      const std::vector<std::pair<std::string, std::string>>& extra) {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<Error>\n";
    xml << "  <Code>" << XmlEscape(error.code) << "</Code>\n";
    xml << "  <Message>" << XmlEscape(error.message) << "</Message>\n";
    if (!ctx.key.empty() && !IsBucketError(error.code)) {
        xml << "  <Key>" << XmlEscape(ctx.key) << "</Key>\n";
    } else if (!ctx.bucket.empty()) {
        xml << "  <BucketName>" << XmlEscape(ctx.bucket) << "</BucketName>\n";
    }
    xml << "  <Resource>" << XmlEscape(ctx.resource) << "</Resource>\n";
    xml << "  <RequestId>" << XmlEscape(ctx.request_id) << "</RequestId>\n";
    for (const auto& [name, value] : extra) {
        xml << "  <" << name << ">" << XmlEscape(value) << "</" << name << ">\n";
    }
    xml << "</Error>";
    return xml.str();
}

S3Response ResponseEncoder::EncodeError(const S3Error& error, const ErrorContext& ctx,
                                        const std::vector<std::pair<std::string, std::string>>& extra) {
    S3Response resp;
    resp.status_code = error.http_status;
    resp.headers["x-amz-request-id"] = ctx.request_id;
    if (error.http_status == 304) {
        return resp;
    }
    resp.SetBody(ErrorXml(error, ctx, extra), "application/xml");
    return resp;
}

void ResponseEncoder::AddObjectHeaders(const metadata::ObjectMeta& meta, S3Response& resp) const {
    resp.headers["ETag"] = QuoteEtag(meta.etag);
    resp.headers["Last-Modified"] = retrieval::FormatHttpDate(meta.last_modified);
    if (!meta.version_id.empty()) {
        resp.headers["x-amz-version-id"] = meta.version_id;
    }
    for (const auto& [name, value] : meta.http_headers) {
        resp.headers[name] = value;
    }
    for (const auto& [name, value] : meta.user_metadata) {
        resp.headers["x-amz-meta-" + name] = value;
    }
}

void ResponseEncoder::ApplyOverrides(const std::map<std::string, std::string>& params,
                                     S3Response& resp) {
    for (const auto& [param, header] : kResponseOverrides) {
        auto it = params.find(param);
        if (it != params.end()) {
            resp.headers[header] = it->second;
        }
    }
}

S3Response ResponseEncoder::Encode(retrieval::ObjectResponse response,
                                   const std::map<std::string, std::string>& params,
                                   const ErrorContext& ctx) const {
    const auto& meta = response.meta;

    if (auto* failed = std::get_if<retrieval::PreconditionFailed>(&response.decision)) {
        return EncodeError(S3Error::PreconditionFailed(), ctx, {{"Condition", failed->condition}});
    }
    if (auto* unsatisfiable = std::get_if<retrieval::RangeNotSatisfiable>(&response.decision)) {
        auto total = std::to_string(unsatisfiable->total);
        auto resp = EncodeError(S3Error::InvalidRange(), ctx, {{"ActualObjectSize", total}});
        resp.headers["Content-Range"] = "bytes */" + total;
        return resp;
    }

    S3Response resp;
    resp.headers["x-amz-request-id"] = ctx.request_id;

    if (std::holds_alternative<retrieval::NotModified>(response.decision)) {
        resp.status_code = 304;
        resp.headers["ETag"] = QuoteEtag(meta.etag);
        resp.headers["Last-Modified"] = retrieval::FormatHttpDate(meta.last_modified);
        if (!meta.version_id.empty()) {
            resp.headers["x-amz-version-id"] = meta.version_id;
        }
        // 304 不带 Content-Length，避免与对象实际长度矛盾
        return resp;
    }

    AddObjectHeaders(meta, resp);
    resp.headers["Accept-Ranges"] = "bytes";
    resp.headers["Content-Type"] =
        meta.content_type.empty() ? default_content_type_ : meta.content_type;

    if (std::holds_alternative<retrieval::PartialContent>(response.decision)) {
        resp.status_code = 206;
        resp.headers["Content-Range"] =
            ContentRange(response.range.first, response.range.last(), meta.size);
    } else {
        resp.status_code = 200;
    }
    resp.headers["Content-Length"] = std::to_string(response.range.length);

    ApplyOverrides(params, resp);
    resp.stream = std::move(response.body);
    return resp;
}

PumpStatus ResponseEncoder::PumpBody(storage::ByteStream& stream, BodySink& sink, size_t budget) {
    size_t sent = 0;
    while (sent < budget) {
        auto chunk = stream.Read(budget - sent);
        if (chunk.hasError()) {
            LOG_WARN("Aborting body stream: {}", chunk.error().ToString());
            return PumpStatus::kFailed;
        }
        const std::string& data = chunk.value();
        if (data.empty()) return PumpStatus::kDone;
        if (!sink.Write(data)) {
            LOG_WARN("Body sink refused {} bytes", data.size());
            return PumpStatus::kFailed;
        }
        sent += data.size();
    }
    return stream.Remaining() == 0 ? PumpStatus::kDone : PumpStatus::kMore;
}

} // namespace s3
} // namespace cirrus

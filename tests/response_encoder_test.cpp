#include <gtest/gtest.h>
#include "cirrus/common/digest.h"
#include "cirrus/protocol/response_encoder.h"

namespace cirrus::s3::test {

namespace {

class StringSink : public BodySink {
public:
    bool Write(std::string_view data) override {
        if (refuse_) return false;
        data_.append(data);
        return true;
    }

    std::string data_;
    bool refuse_ = false;
};

class StringStream : public storage::ByteStream {
public:
    explicit StringStream(std::string data) : data_(std::move(data)) {}
    Result<std::string> Read(size_t max_bytes) override {
        auto chunk = data_.substr(pos_, max_bytes);
        pos_ += chunk.size();
        return chunk;
    }
    uint64_t Remaining() const override { return data_.size() - pos_; }

private:
    std::string data_;
    size_t pos_ = 0;
};

class FailingStream : public storage::ByteStream {
public:
    Result<std::string> Read(size_t) override {
        return Err<std::string>(ErrorCode::kIntegrityError, "digest mismatch");
    }
    uint64_t Remaining() const override { return 1; }
};

metadata::ObjectMeta HelloMeta() {
    metadata::ObjectMeta meta;
    meta.bucket = "test-bucket";
    meta.key = "test-object.txt";
    meta.size = 11;
    meta.etag = Md5Hex("hello world");
    meta.content_type = "text/plain";
    meta.last_modified = 1700000000;
    meta.location = "loc";
    return meta;
}

ErrorContext Ctx() {
    return ErrorContext{"test-bucket", "test-object.txt", "/test-bucket/test-object.txt", "REQ1"};
}

retrieval::ObjectResponse Response(retrieval::Decision decision, ByteRange range = {0, 11}) {
    retrieval::ObjectResponse resp;
    resp.decision = std::move(decision);
    resp.meta = HelloMeta();
    resp.range = range;
    resp.body = std::make_unique<StringStream>(std::string("hello world").substr(range.first, range.length));
    return resp;
}

} // namespace

// ================================
// 成功响应
// ================================

TEST(ResponseEncoderTest, FullContent) {
    ResponseEncoder encoder;
    auto resp = encoder.Encode(Response(retrieval::FullContent{}), {}, Ctx());

    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.headers["Content-Length"], "11");
    EXPECT_EQ(resp.headers["ETag"], "\"5eb63bbbe01eeed093cb22bb8f5acdc3\"");
    EXPECT_EQ(resp.headers["Last-Modified"], "Tue, 14 Nov 2023 22:13:20 GMT");
    EXPECT_EQ(resp.headers["Content-Type"], "text/plain");
    EXPECT_EQ(resp.headers["Accept-Ranges"], "bytes");
    EXPECT_EQ(resp.headers["x-amz-request-id"], "REQ1");
    EXPECT_EQ(resp.headers.count("Content-Range"), 0u);
    EXPECT_EQ(resp.headers.count("x-amz-version-id"), 0u);
    ASSERT_NE(resp.stream, nullptr);

    StringSink sink;
    EXPECT_EQ(ResponseEncoder::PumpBody(*resp.stream, sink, 1024), PumpStatus::kDone);
    EXPECT_EQ(sink.data_, "hello world");
}

TEST(ResponseEncoderTest, PartialContent) {
    ResponseEncoder encoder;
    auto resp = encoder.Encode(Response(retrieval::PartialContent{0, 4}, ByteRange{0, 5}), {}, Ctx());

    EXPECT_EQ(resp.status_code, 206);
    EXPECT_EQ(resp.headers["Content-Length"], "5");
    EXPECT_EQ(resp.headers["Content-Range"], "bytes 0-4/11");
}

TEST(ResponseEncoderTest, MetadataHeadersAndVersion) {
    auto object = Response(retrieval::FullContent{});
    object.meta.version_id = "0001abc";
    object.meta.user_metadata["author"] = "alice";
    object.meta.http_headers["Cache-Control"] = "max-age=60";
    object.meta.content_type.clear();

    ResponseEncoder encoder("application/x-default");
    auto resp = encoder.Encode(std::move(object), {}, Ctx());
    EXPECT_EQ(resp.headers["x-amz-version-id"], "0001abc");
    EXPECT_EQ(resp.headers["x-amz-meta-author"], "alice");
    EXPECT_EQ(resp.headers["Cache-Control"], "max-age=60");
    EXPECT_EQ(resp.headers["Content-Type"], "application/x-default");
}

TEST(ResponseEncoderTest, ResponseOverrides) {
    ResponseEncoder encoder;
    std::map<std::string, std::string> params = {
        {"response-content-type", "application/json"},
        {"response-content-disposition", "attachment; filename=\"x.json\""},
        {"response-cache-control", "no-store"},
    };
    auto resp = encoder.Encode(Response(retrieval::FullContent{}), params, Ctx());
    EXPECT_EQ(resp.headers["Content-Type"], "application/json");
    EXPECT_EQ(resp.headers["Content-Disposition"], "attachment; filename=\"x.json\"");
    EXPECT_EQ(resp.headers["Cache-Control"], "no-store");
}

TEST(ResponseEncoderTest, NotModified) {
    ResponseEncoder encoder;
    auto object = Response(retrieval::NotModified{});
    object.body.reset();
    auto resp = encoder.Encode(std::move(object), {}, Ctx());

    EXPECT_EQ(resp.status_code, 304);
    EXPECT_EQ(resp.headers["ETag"], "\"5eb63bbbe01eeed093cb22bb8f5acdc3\"");
    EXPECT_EQ(resp.headers.count("Last-Modified"), 1u);
    EXPECT_EQ(resp.headers.count("Content-Length"), 0u);
    EXPECT_TRUE(resp.body.empty());
    EXPECT_EQ(resp.stream, nullptr);

    auto as_error = ResponseEncoder::EncodeError(
        S3Error::FromStatus(Status(ErrorCode::kNotModified, "")), Ctx());
    EXPECT_EQ(as_error.status_code, 304);
    EXPECT_EQ(as_error.headers.count("Content-Length"), 0u);
}

// ================================
// 错误响应
// ================================

TEST(ResponseEncoderTest, PreconditionFailed) {
    ResponseEncoder encoder;
    auto resp = encoder.Encode(Response(retrieval::PreconditionFailed{"If-Match"}), {}, Ctx());
    EXPECT_EQ(resp.status_code, 412);
    EXPECT_EQ(resp.stream, nullptr);
    EXPECT_NE(resp.body.find("<Code>PreconditionFailed</Code>"), std::string::npos);
    EXPECT_NE(resp.body.find("<Condition>If-Match</Condition>"), std::string::npos);
    EXPECT_EQ(resp.headers["Content-Type"], "application/xml");
}

TEST(ResponseEncoderTest, RangeNotSatisfiable) {
    ResponseEncoder encoder;
    auto resp = encoder.Encode(Response(retrieval::RangeNotSatisfiable{11}), {}, Ctx());
    EXPECT_EQ(resp.status_code, 416);
    EXPECT_EQ(resp.headers["Content-Range"], "bytes */11");
    EXPECT_NE(resp.body.find("<Code>InvalidRange</Code>"), std::string::npos);
    EXPECT_NE(resp.body.find("<ActualObjectSize>11</ActualObjectSize>"), std::string::npos);
}

TEST(ResponseEncoderTest, NoSuchKeyDocument) {
    auto resp = ResponseEncoder::EncodeError(S3Error::NoSuchKey(), Ctx());
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_EQ(resp.headers["Content-Length"], std::to_string(resp.body.size()));
    EXPECT_EQ(resp.body,
              "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
              "<Error>\n"
              "  <Code>NoSuchKey</Code>\n"
              "  <Message>The specified key does not exist.</Message>\n"
              "  <Key>test-object.txt</Key>\n"
              "  <Resource>/test-bucket/test-object.txt</Resource>\n"
              "  <RequestId>REQ1</RequestId>\n"
              "</Error>");
}

TEST(ResponseEncoderTest, BucketErrorNamesBucket) {
    ErrorContext ctx{"missing", "", "/missing", "REQ2"};
    auto resp = ResponseEncoder::EncodeError(S3Error::NoSuchBucket(), ctx);
    EXPECT_NE(resp.body.find("<BucketName>missing</BucketName>"), std::string::npos);
    EXPECT_EQ(resp.body.find("<Key>"), std::string::npos);
}

TEST(ResponseEncoderTest, BucketErrorOnObjectRequestNamesBucket) {
    ErrorContext ctx{"missing", "some/key", "/missing/some/key", "REQ3"};
    auto resp = ResponseEncoder::EncodeError(S3Error::NoSuchBucket(), ctx);
    EXPECT_NE(resp.body.find("<BucketName>missing</BucketName>"), std::string::npos);
    EXPECT_EQ(resp.body.find("<Key>"), std::string::npos);
}

TEST(ResponseEncoderTest, EscapesXml) {
    EXPECT_EQ(ResponseEncoder::XmlEscape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
    ErrorContext ctx{"b", "<script>", "/b/<script>", "R"};
    auto resp = ResponseEncoder::EncodeError(S3Error::NoSuchKey(), ctx);
    EXPECT_EQ(resp.body.find("<script>"), std::string::npos);
}

TEST(S3ErrorTest, StatusMapping) {
    EXPECT_EQ(S3Error::FromStatus(Status::NoSuchKey()).http_status, 404);
    EXPECT_EQ(S3Error::FromStatus(Status::NoSuchBucket()).code, "NoSuchBucket");
    EXPECT_EQ(S3Error::FromStatus(Status::NoSuchVersion()).code, "NoSuchVersion");
    EXPECT_EQ(S3Error::FromStatus(Status::Integrity("x")).http_status, 500);
    EXPECT_EQ(S3Error::FromStatus(Status::IO("x")).code, "InternalError");
    EXPECT_EQ(S3Error::FromStatus(Status(ErrorCode::kBucketNotEmpty, "")).http_status, 409);
    EXPECT_EQ(S3Error::FromStatus(Status(ErrorCode::kAccessDenied, "")).http_status, 403);
}

// ================================
// PumpBody
// ================================

TEST(PumpBodyTest, RespectsBudget) {
    StringStream stream("0123456789");
    StringSink sink;
    EXPECT_EQ(ResponseEncoder::PumpBody(stream, sink, 4), PumpStatus::kMore);
    EXPECT_EQ(sink.data_, "0123");
    EXPECT_EQ(ResponseEncoder::PumpBody(stream, sink, 4), PumpStatus::kMore);
    EXPECT_EQ(ResponseEncoder::PumpBody(stream, sink, 4), PumpStatus::kDone);
    EXPECT_EQ(sink.data_, "0123456789");
}

TEST(PumpBodyTest, FailuresAbort) {
    FailingStream failing;
    StringSink sink;
    EXPECT_EQ(ResponseEncoder::PumpBody(failing, sink, 4), PumpStatus::kFailed);
    EXPECT_TRUE(sink.data_.empty());

    StringStream stream("abc");
    sink.refuse_ = true;
    EXPECT_EQ(ResponseEncoder::PumpBody(stream, sink, 4), PumpStatus::kFailed);
}

} // namespace cirrus::s3::test

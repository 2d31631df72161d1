#pragma once

#include <set>
#include <utility>
#include <string>
#include "cirrus/protocol/s3_types.h"

namespace cirrus {
namespace s3 {

// ================================
// Authorizer - 在访问元数据之前做放行/拒绝判断
// ================================
class Authorizer {
public:
    virtual ~Authorizer() = default;
    virtual bool Authorize(const S3Request& req) = 0;
};

class AllowAllAuthorizer : public Authorizer {
public:
    bool Authorize(const S3Request&) override { return true; }
};

// 放行 SigV4 Authorization 头中 access key 属于配置列表的请求，
// 不校验签名本身
class AccessKeyAuthorizer : public Authorizer {
public:
    explicit AccessKeyAuthorizer(std::set<std::string> access_keys)
        : access_keys_(std::move(access_keys)) {}

    bool Authorize(const S3Request& req) override;

    // "AWS4-HMAC-SHA256 Credential=AKID/20260101/us-east-1/s3/aws4_request, ..." -> "AKID"
    static std::string AccessKeyOf(const std::string& authorization);

private:
    std::set<std::string> access_keys_;
};

} // namespace s3
} // namespace cirrus

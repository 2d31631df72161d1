#include "cirrus/protocol/authorizer.h"
#include "cirrus/common/logger.h"

namespace cirrus {
namespace s3 {

std::string AccessKeyAuthorizer::AccessKeyOf(const std::string& authorization) {
    static const std::string kCredential = "Credential=";
    auto pos = authorization.find(kCredential);
    if (pos == std::string::npos) return "";
    pos += kCredential.size();
    auto end = authorization.find('/', pos);
    if (end == std::string::npos) return "";
    return authorization.substr(pos, end - pos);
}

bool AccessKeyAuthorizer::Authorize(const S3Request& req) {
    auto key = AccessKeyOf(req.GetHeader("Authorization"));
    if (key.empty()) {
        LOG_DEBUG("Denied {} {}: no credential", req.method, req.Resource());
        return false;
    }
    if (access_keys_.count(key) == 0) {
        LOG_DEBUG("Denied {} {}: unknown access key {}", req.method, req.Resource(), key);
        return false;
    }
    return true;
}

} // namespace s3
} // namespace cirrus

#include "cirrus/common/types.h"
#include <algorithm>
#include <cctype>

namespace cirrus {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOK:                  return "OK";
        case ErrorCode::kNotFound:            return "NotFound";
        case ErrorCode::kNoSuchBucket:        return "NoSuchBucket";
        case ErrorCode::kNoSuchKey:           return "NoSuchKey";
        case ErrorCode::kNoSuchVersion:       return "NoSuchVersion";
        case ErrorCode::kBucketAlreadyExists: return "BucketAlreadyExists";
        case ErrorCode::kBucketNotEmpty:      return "BucketNotEmpty";
        case ErrorCode::kNotModified:         return "NotModified";
        case ErrorCode::kPreconditionFailed:  return "PreconditionFailed";
        case ErrorCode::kInvalidRange:        return "InvalidRange";
        case ErrorCode::kInvalidArgument:     return "InvalidArgument";
        case ErrorCode::kAccessDenied:        return "AccessDenied";
        case ErrorCode::kIntegrityError:      return "IntegrityError";
        case ErrorCode::kIOError:             return "IOError";
        case ErrorCode::kNotImplemented:      return "NotImplemented";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (OK()) return "OK";
    std::string s = ErrorCodeName(code_);
    if (!msg_.empty()) {
        s += ": ";
        s += msg_;
    }
    return s;
}

bool HeaderNameLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

} // namespace cirrus

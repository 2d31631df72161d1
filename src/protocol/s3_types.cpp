#include "cirrus/protocol/s3_types.h"

namespace cirrus {
namespace s3 {

const char* S3OpName(S3Op op) {
    switch (op) {
        case S3Op::UNKNOWN:               return "Unknown";
        case S3Op::UNSUPPORTED:           return "Unsupported";
        case S3Op::CREATE_BUCKET:         return "CreateBucket";
        case S3Op::DELETE_BUCKET:         return "DeleteBucket";
        case S3Op::HEAD_BUCKET:           return "HeadBucket";
        case S3Op::PUT_BUCKET_VERSIONING: return "PutBucketVersioning";
        case S3Op::GET_OBJECT:            return "GetObject";
        case S3Op::HEAD_OBJECT:           return "HeadObject";
        case S3Op::PUT_OBJECT:            return "PutObject";
        case S3Op::DELETE_OBJECT:         return "DeleteObject";
    }
    return "Unknown";
}

S3Error S3Error::FromStatus(const Status& status) {
    switch (status.code()) {
        case ErrorCode::kNoSuchBucket:        return NoSuchBucket();
        case ErrorCode::kNotFound:
        case ErrorCode::kNoSuchKey:           return NoSuchKey();
        case ErrorCode::kNoSuchVersion:       return NoSuchVersion();
        case ErrorCode::kBucketAlreadyExists: return BucketAlreadyExists();
        case ErrorCode::kBucketNotEmpty:      return BucketNotEmpty();
        case ErrorCode::kPreconditionFailed:  return PreconditionFailed();
        case ErrorCode::kInvalidRange:        return InvalidRange();
        case ErrorCode::kNotModified:         return {304, "NotModified", "Not Modified"};
        case ErrorCode::kAccessDenied:        return AccessDenied();
        case ErrorCode::kNotImplemented:      return NotImplemented();
        case ErrorCode::kInvalidArgument: {
            S3Error err = InvalidArgument();
            if (!status.message().empty()) err.message = status.message();
            return err;
        }
        case ErrorCode::kOK:
        case ErrorCode::kIntegrityError:
        case ErrorCode::kIOError:
            break;
    }
    return InternalError();
}

std::string S3Request::Resource() const {
    auto q = uri.find('?');
    return q == std::string::npos ? uri : uri.substr(0, q);
}

} // namespace s3
} // namespace cirrus

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <chrono>

namespace cirrus {

using Timestamp = uint64_t;           // 自 epoch 起的秒数
using StorageLocation = std::string;  // 不透明句柄，由对象存储管理

// ================================
// 错误码
// ================================
enum class ErrorCode : int {
    kOK = 0,
    kNotFound,             // 存储层: 位置不存在
    kNoSuchBucket,
    kNoSuchKey,
    kNoSuchVersion,
    kBucketAlreadyExists,
    kBucketNotEmpty,
    kNotModified,          // 304, not a real failure
    kPreconditionFailed,
    kInvalidRange,
    kInvalidArgument,
    kAccessDenied,
    kIntegrityError,
    kIOError,
    kNotImplemented,
};

const char* ErrorCodeName(ErrorCode code);

class Status {
public:
    Status() : code_(ErrorCode::kOK) {}
    Status(ErrorCode code, const std::string& msg)
        : code_(code), msg_(msg) {}

    bool OK() const { return code_ == ErrorCode::kOK; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return msg_; }

    std::string ToString() const;

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") {
        return Status(ErrorCode::kNotFound, msg);
    }
    static Status NoSuchBucket(const std::string& msg = "") {
        return Status(ErrorCode::kNoSuchBucket, msg);
    }
    static Status NoSuchKey(const std::string& msg = "") {
        return Status(ErrorCode::kNoSuchKey, msg);
    }
    static Status NoSuchVersion(const std::string& msg = "") {
        return Status(ErrorCode::kNoSuchVersion, msg);
    }
    static Status InvalidArgument(const std::string& msg = "") {
        return Status(ErrorCode::kInvalidArgument, msg);
    }
    static Status Integrity(const std::string& msg = "") {
        return Status(ErrorCode::kIntegrityError, msg);
    }
    static Status IO(const std::string& msg = "") {
        return Status(ErrorCode::kIOError, msg);
    }

private:
    ErrorCode code_;
    std::string msg_;
};

// ================================
// ByteRange: half-open [first, first + length)
// ================================
struct ByteRange {
    uint64_t first = 0;
    uint64_t length = 0;

    uint64_t end() const { return first + length; }
    uint64_t last() const { return first + length - 1; }  // only valid when length > 0

    static ByteRange Whole(uint64_t size) { return ByteRange{0, size}; }
};

// 大小写不敏感的头部表，与 HTTP 字段名一致
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const;
};
using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

// ================================
// 时间工具
// ================================
inline uint64_t NowInSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace cirrus

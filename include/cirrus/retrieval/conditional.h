#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include "cirrus/common/types.h"
#include "cirrus/metadata/object_meta.h"

namespace cirrus::retrieval {

// ================================
// Decision - GET/HEAD 在任何 I/O 之前的应答决定
// ================================
struct FullContent {};

struct PartialContent {
    uint64_t first;
    uint64_t last;      // 闭区间
};

struct NotModified {};

struct PreconditionFailed {
    std::string condition;   // 不满足的头，例如 "If-Match"
};

struct RangeNotSatisfiable {
    uint64_t total;
};

using Decision = std::variant<FullContent, PartialContent, NotModified,
                              PreconditionFailed, RangeNotSatisfiable>;

// 只依赖对象元数据和请求头的纯函数
//
// Order: If-Match, else If-Unmodified-Since (412); then If-None-Match, else
// If-Modified-Since (304); then Range. A precondition failure wins over
// not-modified.
Decision EvaluateRequest(const metadata::ObjectMeta& meta, const HeaderMap& headers);

// ================================
// 基础函数
// ================================

// 针对 `size` 字节对象解析 Range 头
struct RangeResolution {
    enum class Kind {
        kWhole,          // 无 Range、格式错误或多段: 返回整个对象
        kPartial,
        kUnsatisfiable,
    };
    Kind kind = Kind::kWhole;
    uint64_t first = 0;
    uint64_t last = 0;
};

RangeResolution ResolveRange(const std::string& header, uint64_t size);

// 支持 IMF-fixdate、RFC 850 和 asctime 格式，都无法解析时返回 nullopt
std::optional<Timestamp> ParseHttpDate(const std::string& text);

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string FormatHttpDate(Timestamp ts);

// If-Match / If-None-Match 列表与 ETag 的弱比较
// "*" matches any existing object.
bool EtagListMatches(const std::string& header, const std::string& etag);

} // namespace cirrus::retrieval

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "cirrus/common/types.h"
#include "cirrus/common/result.h"

namespace cirrus::metadata {

enum class VersioningState : uint32_t {
    kUnversioned = 0,
    kEnabled = 1,
    kSuspended = 2,
};

// ================================
// 桶记录
// ================================
struct BucketMeta {
    std::string name;
    Timestamp creation_time = 0;
    VersioningState versioning = VersioningState::kUnversioned;

    std::string Encode() const;
    static Result<BucketMeta> Decode(const std::string& data);
};

// ================================
// 对象记录
// ================================
struct ObjectMeta {
    std::string bucket;
    std::string key;
    uint64_t size = 0;
    std::string etag;               // 十六进制 MD5，不带引号
    std::string content_type;
    Timestamp last_modified = 0;
    std::string version_id;         // 无版本写入时为空
    StorageLocation location;
    // 随对象保存的表示头 (Cache-Control, Content-Encoding, ...)
    std::map<std::string, std::string> http_headers;
    // x-amz-meta-* 头，名字转小写
    std::map<std::string, std::string> user_metadata;

    std::string Encode() const;
    static Result<ObjectMeta> Decode(const std::string& data);
};

// 两种记录共用的小端、长度前缀字段编解码
namespace encoding {

void PutU32(std::string& buf, uint32_t v);
void PutU64(std::string& buf, uint64_t v);
void PutString(std::string& buf, const std::string& s);

bool GetU32(const std::string& data, size_t& pos, uint32_t& v);
bool GetU64(const std::string& data, size_t& pos, uint64_t& v);
bool GetString(const std::string& data, size_t& pos, std::string& s);

} // namespace encoding

} // namespace cirrus::metadata

// ================================
// 元数据记录编解码
// ================================

#include "cirrus/metadata/object_meta.h"

namespace cirrus::metadata {

namespace {
constexpr uint32_t kBucketFormat = 1;
constexpr uint32_t kObjectFormat = 1;

void PutMap(std::string& buf, const std::map<std::string, std::string>& m) {
    encoding::PutU32(buf, static_cast<uint32_t>(m.size()));
    for (const auto& [k, v] : m) {
        encoding::PutString(buf, k);
        encoding::PutString(buf, v);
    }
}

bool GetMap(const std::string& data, size_t& pos, std::map<std::string, std::string>& m) {
    uint32_t count;
    if (!encoding::GetU32(data, pos, count)) return false;
    m.clear();
    for (uint32_t i = 0; i < count; i++) {
        std::string k, v;
        if (!encoding::GetString(data, pos, k) || !encoding::GetString(data, pos, v)) return false;
        m[k] = v;
    }
    return true;
}
} // namespace

namespace encoding {

void PutU32(std::string& buf, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
    }
}

void PutU64(std::string& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
    }
}

void PutString(std::string& buf, const std::string& s) {
    PutU32(buf, static_cast<uint32_t>(s.size()));
    buf.append(s);
}

bool GetU32(const std::string& data, size_t& pos, uint32_t& v) {
    if (pos + 4 > data.size()) return false;
    v = 0;
    for (int i = 0; i < 4; ++i, ++pos) {
        v |= static_cast<uint32_t>(static_cast<uint8_t>(data[pos])) << (i * 8);
    }
    return true;
}

bool GetU64(const std::string& data, size_t& pos, uint64_t& v) {
    if (pos + 8 > data.size()) return false;
    v = 0;
    for (int i = 0; i < 8; ++i, ++pos) {
        v |= static_cast<uint64_t>(static_cast<uint8_t>(data[pos])) << (i * 8);
    }
    return true;
}

bool GetString(const std::string& data, size_t& pos, std::string& s) {
    uint32_t len;
    if (!GetU32(data, pos, len)) return false;
    if (pos + len > data.size()) return false;
    s = data.substr(pos, len);
    pos += len;
    return true;
}

} // namespace encoding

// ================================
// BucketMeta
// ================================
std::string BucketMeta::Encode() const {
    std::string buf;
    encoding::PutU32(buf, kBucketFormat);
    encoding::PutString(buf, name);
    encoding::PutU64(buf, creation_time);
    encoding::PutU32(buf, static_cast<uint32_t>(versioning));
    return buf;
}

Result<BucketMeta> BucketMeta::Decode(const std::string& data) {
    BucketMeta meta;
    size_t pos = 0;
    uint32_t ver, versioning;
    if (!encoding::GetU32(data, pos, ver) || ver != kBucketFormat ||
        !encoding::GetString(data, pos, meta.name) ||
        !encoding::GetU64(data, pos, meta.creation_time) ||
        !encoding::GetU32(data, pos, versioning) ||
        versioning > static_cast<uint32_t>(VersioningState::kSuspended)) {
        return Err<BucketMeta>(ErrorCode::kIntegrityError, "Corrupt bucket record");
    }
    meta.versioning = static_cast<VersioningState>(versioning);
    return meta;
}

// ================================
// ObjectMeta
// ================================
std::string ObjectMeta::Encode() const {
    std::string buf;
    encoding::PutU32(buf, kObjectFormat);
    encoding::PutString(buf, bucket);
    encoding::PutString(buf, key);
    encoding::PutU64(buf, size);
    encoding::PutString(buf, etag);
    encoding::PutString(buf, content_type);
    encoding::PutU64(buf, last_modified);
    encoding::PutString(buf, version_id);
    encoding::PutString(buf, location);
    PutMap(buf, http_headers);
    PutMap(buf, user_metadata);
    return buf;
}

Result<ObjectMeta> ObjectMeta::Decode(const std::string& data) {
    ObjectMeta meta;
    size_t pos = 0;
    uint32_t ver;
    if (!encoding::GetU32(data, pos, ver) || ver != kObjectFormat ||
        !encoding::GetString(data, pos, meta.bucket) ||
        !encoding::GetString(data, pos, meta.key) ||
        !encoding::GetU64(data, pos, meta.size) ||
        !encoding::GetString(data, pos, meta.etag) ||
        !encoding::GetString(data, pos, meta.content_type) ||
        !encoding::GetU64(data, pos, meta.last_modified) ||
        !encoding::GetString(data, pos, meta.version_id) ||
        !encoding::GetString(data, pos, meta.location) ||
        !GetMap(data, pos, meta.http_headers) ||
        !GetMap(data, pos, meta.user_metadata) ||
        pos != data.size()) {
        return Err<ObjectMeta>(ErrorCode::kIntegrityError, "Corrupt object record");
    }
    return meta;
}

} // namespace cirrus::metadata

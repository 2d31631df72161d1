#pragma once

#include <cstddef>
#include <string>

// OpenSSL 上下文前置声明 (C 库，全局命名空间)
struct evp_md_ctx_st;

namespace cirrus {

// ================================
// Md5Hasher - 增量 MD5 (计算 ETag)
// ================================
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    void Update(const void* data, size_t size);
    void Update(const std::string& data) { Update(data.data(), data.size()); }

    // 小写十六进制摘要，之后不能再 Update
    std::string FinalHex();

private:
    evp_md_ctx_st* ctx_;
    bool finished_ = false;
};

std::string Md5Hex(const std::string& data);

// Hex string, 2 * bytes long, for ids and storage locations: unique, not
// secret. Drawn from OpenSSL's RAND_bytes; if that fails the failure is
// logged and PseudoRandomHex is used instead.
std::string RandomHex(size_t bytes);

// Non-cryptographic fallback of RandomHex (mt19937_64 per thread).
std::string PseudoRandomHex(size_t bytes);

// 请求 ID: 时间前缀 + 随机后缀，大写十六进制
std::string NewRequestId();

} // namespace cirrus

#include "cirrus/common/digest.h"
#include "cirrus/common/logger.h"
#include "cirrus/common/types.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace cirrus {

namespace {

std::string ToHex(const unsigned char* data, size_t len) {
    std::ostringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
    }
}

Md5Hasher::~Md5Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Md5Hasher::Update(const void* data, size_t size) {
    if (size > 0) EVP_DigestUpdate(ctx_, data, size);
}

std::string Md5Hasher::FinalHex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (finished_) return "";
    finished_ = true;
    EVP_DigestFinal_ex(ctx_, digest, &digest_len);
    return ToHex(digest, digest_len);
}

std::string Md5Hex(const std::string& data) {
    Md5Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

std::string PseudoRandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::string buf(bytes, '\0');
    auto* p = reinterpret_cast<unsigned char*>(buf.data());
    for (size_t i = 0; i < bytes; i++) p[i] = static_cast<unsigned char>(rng());
    return ToHex(p, bytes);
}

std::string RandomHex(size_t bytes) {
    std::string buf(bytes, '\0');
    auto* p = reinterpret_cast<unsigned char*>(buf.data());
    if (RAND_bytes(p, static_cast<int>(bytes)) != 1) {
        // 仅在 OpenSSL 随机数生成器无法播种时发生
        LOG_WARN("RAND_bytes failed (error {}), using non-cryptographic ids",
                 ERR_get_error());
        return PseudoRandomHex(bytes);
    }
    return ToHex(p, bytes);
}

std::string NewRequestId() {
    static std::atomic<uint64_t> seq{0};
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << (NowInSeconds() & 0xffffffffULL)
       << std::setw(4) << (seq.fetch_add(1) & 0xffff) << RandomHex(4);
    std::string id = ss.str();
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return id;
}

} // namespace cirrus

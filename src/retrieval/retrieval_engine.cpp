// ================================
// GetObject 读取路径
// ================================

#include "cirrus/retrieval/retrieval_engine.h"
#include "cirrus/common/logger.h"
#include "cirrus/common/result_macros.h"
#include <cctype>

namespace cirrus::retrieval {

// ================================
// VerifyingStream
// ================================

VerifyingStream::VerifyingStream(std::unique_ptr<storage::ByteStream> inner,
                                 uint64_t expected_length,
                                 std::string expected_md5,
                                 std::string description)
    : inner_(std::move(inner)),
      expected_(expected_length),
      expected_md5_(std::move(expected_md5)),
      description_(std::move(description)) {
    if (!expected_md5_.empty()) {
        hasher_ = std::make_unique<Md5Hasher>();
    }
}

Result<std::string> VerifyingStream::Fail(const std::string& why) {
    failed_ = true;
    LOG_ERROR("Integrity error reading {}: {}", description_, why);
    return Err<std::string>(ErrorCode::kIntegrityError, description_ + ": " + why);
}

Result<std::string> VerifyingStream::Read(size_t max_bytes) {
    if (failed_) {
        return Err<std::string>(ErrorCode::kIntegrityError, description_ + ": stream already failed");
    }
    if (delivered_ >= expected_) return std::string();

    auto chunk = inner_->Read(max_bytes);
    if (chunk.hasError()) {
        failed_ = true;
        if (chunk.code() == ErrorCode::kIntegrityError) {
            LOG_ERROR("Integrity error reading {}: {}", description_, chunk.error().message());
        }
        return chunk;
    }

    const std::string& data = chunk.value();
    if (data.empty()) {
        return Fail("storage ended after " + std::to_string(delivered_) + " of " +
                    std::to_string(expected_) + " bytes");
    }
    if (data.size() > expected_ - delivered_) {
        return Fail("storage returned more bytes than recorded");
    }

    if (hasher_) hasher_->Update(data);
    delivered_ += data.size();

    if (delivered_ == expected_ && hasher_) {
        auto actual = hasher_->FinalHex();
        if (actual != expected_md5_) {
            return Fail("content digest " + actual + " does not match ETag " + expected_md5_);
        }
    }
    return chunk;
}

// ================================
// RetrievalEngine
// ================================

RetrievalEngine::RetrievalEngine(std::shared_ptr<metadata::MetadataIndex> index,
                                 std::shared_ptr<storage::ObjectStore> store)
    : index_(std::move(index)), store_(std::move(store)) {}

bool RetrievalEngine::IsMd5Etag(const std::string& etag) {
    if (etag.size() != 32) return false;
    for (char c : etag) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result<metadata::ObjectMeta> RetrievalEngine::Resolve(const GetObjectRequest& request) const {
    if (request.version_id.empty()) {
        return index_->Lookup(request.bucket, request.key);
    }
    return index_->Lookup(request.bucket, request.key, request.version_id);
}

Result<std::unique_ptr<storage::ByteStream>> RetrievalEngine::OpenBody(
    const metadata::ObjectMeta& meta, const ByteRange& range) const {
    ASSIGN_OR_RETURN(uint64_t stored_size, store_->Size(meta.location));
    if (stored_size != meta.size) {
        LOG_ERROR("Blob {} for {}/{} holds {} bytes, metadata records {}",
                  meta.location, meta.bucket, meta.key, stored_size, meta.size);
        return Err<std::unique_ptr<storage::ByteStream>>(
            ErrorCode::kIntegrityError, "Stored size does not match metadata");
    }

    ASSIGN_OR_RETURN(auto stream, store_->Read(meta.location, range));

    // 只有整对象读取才能校验内容摘要
    bool whole = range.first == 0 && range.length == meta.size;
    std::string md5 = whole && IsMd5Etag(meta.etag) ? meta.etag : std::string();

    return std::unique_ptr<storage::ByteStream>(std::make_unique<VerifyingStream>(
        std::move(stream), range.length, std::move(md5), meta.bucket + "/" + meta.key));
}

Result<ObjectResponse> RetrievalEngine::Get(const GetObjectRequest& request) const {
    ASSIGN_OR_RETURN(auto meta, Resolve(request));

    // 仅当查询与打开之间有并发写入替换了条目、blob 被回收时才会进入第二轮
    for (int attempt = 0;; ++attempt) {
        ObjectResponse response;
        response.decision = EvaluateRequest(meta, request.headers);

        bool has_body = true;
        if (auto* partial = std::get_if<PartialContent>(&response.decision)) {
            response.range = ByteRange{partial->first, partial->last - partial->first + 1};
        } else if (std::holds_alternative<FullContent>(response.decision)) {
            response.range = ByteRange::Whole(meta.size);
        } else {
            has_body = false;
        }

        if (has_body && !request.head_only) {
            auto body = OpenBody(meta, response.range);
            if (body.hasError()) {
                if (body.code() != ErrorCode::kNotFound) return body.error();

                ASSIGN_OR_RETURN(auto fresh, Resolve(request));
                if (attempt == 0 && fresh.location != meta.location) {
                    meta = std::move(fresh);
                    continue;
                }
                LOG_ERROR("Metadata for {}/{} points at missing blob {}",
                          meta.bucket, meta.key, meta.location);
                return Err<ObjectResponse>(ErrorCode::kIntegrityError,
                                           "Object data missing for " + meta.key);
            }
            response.body = std::move(body).value();
        }

        response.meta = std::move(meta);
        return response;
    }
}

} // namespace cirrus::retrieval

// ================================
// 内存对象存储
// ================================

#include "cirrus/storage/object_store.h"
#include "cirrus/common/digest.h"
#include "cirrus/common/logger.h"
#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace cirrus::storage {

namespace {

// 持有 blob 引用，Remove() 不会影响正在读取的数据
class MemoryStream : public ByteStream {
public:
    MemoryStream(std::shared_ptr<const std::string> blob, ByteRange range)
        : blob_(std::move(blob)), pos_(range.first), end_(range.end()) {}

    Result<std::string> Read(size_t max_bytes) override {
        if (pos_ >= end_) return std::string();
        if (pos_ >= blob_->size()) {
            return Err<std::string>(ErrorCode::kIntegrityError,
                                    "Blob ended at " + std::to_string(blob_->size()) +
                                    ", expected " + std::to_string(end_));
        }
        uint64_t n = std::min<uint64_t>({max_bytes, end_ - pos_, blob_->size() - pos_});
        std::string chunk = blob_->substr(pos_, n);
        pos_ += n;
        return chunk;
    }

    uint64_t Remaining() const override { return end_ - pos_; }

private:
    std::shared_ptr<const std::string> blob_;
    uint64_t pos_;
    uint64_t end_;
};

} // namespace

class MemoryObjectStore::Impl {
public:
    mutable std::shared_mutex mutex_;
    std::unordered_map<StorageLocation, std::shared_ptr<const std::string>> blobs_;

    std::shared_ptr<const std::string> Find(const StorageLocation& location) const {
        std::shared_lock lock(mutex_);
        auto it = blobs_.find(location);
        return it == blobs_.end() ? nullptr : it->second;
    }
};

MemoryObjectStore::MemoryObjectStore() : impl_(std::make_unique<Impl>()) {}

MemoryObjectStore::~MemoryObjectStore() = default;

Result<StorageLocation> MemoryObjectStore::Write(const std::string& data) {
    auto blob = std::make_shared<const std::string>(data);
    std::unique_lock lock(impl_->mutex_);
    StorageLocation location;
    do {
        location = RandomHex(16);
    } while (impl_->blobs_.count(location));
    impl_->blobs_.emplace(location, std::move(blob));
    LOG_DEBUG("MemoryObjectStore: wrote {} bytes to {}", data.size(), location);
    return location;
}

Result<uint64_t> MemoryObjectStore::Size(const StorageLocation& location) {
    auto blob = impl_->Find(location);
    if (!blob) return Err<uint64_t>(ErrorCode::kNotFound, "No blob at " + location);
    return static_cast<uint64_t>(blob->size());
}

Result<std::unique_ptr<ByteStream>> MemoryObjectStore::Read(
    const StorageLocation& location,
    const ByteRange& range
) {
    auto blob = impl_->Find(location);
    if (!blob) {
        return Err<std::unique_ptr<ByteStream>>(ErrorCode::kNotFound, "No blob at " + location);
    }
    if (range.length > 0 && range.first >= blob->size()) {
        return Err<std::unique_ptr<ByteStream>>(ErrorCode::kInvalidRange,
                                                "Offset past end of blob " + location);
    }
    return std::unique_ptr<ByteStream>(std::make_unique<MemoryStream>(std::move(blob), range));
}

Result<Void> MemoryObjectStore::Remove(const StorageLocation& location) {
    std::unique_lock lock(impl_->mutex_);
    impl_->blobs_.erase(location);
    return Ok();
}

void MemoryObjectStore::OverwriteForTesting(const StorageLocation& location,
                                            const std::string& data) {
    std::unique_lock lock(impl_->mutex_);
    impl_->blobs_[location] = std::make_shared<const std::string>(data);
}

} // namespace cirrus::storage

#include "cirrus/metadata/metadata_backend.h"
#include <map>
#include <mutex>
#include <shared_mutex>

namespace cirrus::metadata {

class MemoryMetadataBackend::Impl {
public:
    std::shared_mutex mutex_;
    std::map<std::string, std::string> kv_;
};

MemoryMetadataBackend::MemoryMetadataBackend() : impl_(std::make_unique<Impl>()) {}

MemoryMetadataBackend::~MemoryMetadataBackend() = default;

Result<std::string> MemoryMetadataBackend::Get(const std::string& key) {
    std::shared_lock lock(impl_->mutex_);
    auto it = impl_->kv_.find(key);
    if (it == impl_->kv_.end()) {
        return Err<std::string>(ErrorCode::kNotFound, key);
    }
    return it->second;
}

Result<Void> MemoryMetadataBackend::Write(const WriteBatch& batch) {
    std::unique_lock lock(impl_->mutex_);
    for (const auto& op : batch.ops()) {
        if (op.is_delete) {
            impl_->kv_.erase(op.key);
        } else {
            impl_->kv_[op.key] = op.value;
        }
    }
    return Ok();
}

Result<std::vector<std::pair<std::string, std::string>>> MemoryMetadataBackend::Scan(
    const std::string& prefix, size_t limit) {
    std::vector<std::pair<std::string, std::string>> result;
    std::shared_lock lock(impl_->mutex_);
    for (auto it = impl_->kv_.lower_bound(prefix);
         it != impl_->kv_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
         ++it) {
        if (result.size() >= limit) break;
        result.emplace_back(it->first, it->second);
    }
    return result;
}

void RegisterMemoryBackend() {
    MetadataBackendFactory::Instance().Register("memory",
        [](const std::string&) -> Result<std::unique_ptr<MetadataBackend>> {
            return std::unique_ptr<MetadataBackend>(std::make_unique<MemoryMetadataBackend>());
        });
}

} // namespace cirrus::metadata

// ================================
// 本地文件系统对象存储
// ================================

#include "cirrus/storage/object_store.h"
#include "cirrus/common/digest.h"
#include "cirrus/common/logger.h"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace cirrus::storage {

namespace {

// 打开的 ifstream 持有 inode，并发 Remove() 不影响正在进行的读取
class FileStream : public ByteStream {
public:
    FileStream(std::ifstream file, std::string path, ByteRange range)
        : file_(std::move(file)), path_(std::move(path)),
          pos_(range.first), end_(range.end()) {}

    Result<std::string> Read(size_t max_bytes) override {
        if (pos_ >= end_) return std::string();

        uint64_t want = std::min<uint64_t>(max_bytes, end_ - pos_);
        std::string chunk(want, '\0');
        file_.read(chunk.data(), static_cast<std::streamsize>(want));
        auto got = static_cast<uint64_t>(file_.gcount());

        if (got < want) {
            if (file_.eof()) {
                LOG_ERROR("Short read from {}: ended at {}, expected {}",
                          path_, pos_ + got, end_);
                return Err<std::string>(ErrorCode::kIntegrityError,
                                        "Blob shorter than recorded: " + path_);
            }
            LOG_ERROR("Failed to read {} at offset {}", path_, pos_ + got);
            return Err<std::string>(ErrorCode::kIOError, "Failed to read " + path_);
        }

        pos_ += got;
        return chunk;
    }

    uint64_t Remaining() const override { return end_ - pos_; }

private:
    std::ifstream file_;
    std::string path_;
    uint64_t pos_;
    uint64_t end_;
};

} // namespace

LocalObjectStore::LocalObjectStore(Config config)
    : config_(std::move(config)) {
    std::error_code ec;
    std::filesystem::create_directories(config_.data_dir, ec);
    if (ec) {
        LOG_ERROR("Failed to create data directory {}: {}", config_.data_dir, ec.message());
    }
    LOG_INFO("LocalObjectStore initialized: {}", config_.data_dir);
}

std::string LocalObjectStore::LocationToPath(const StorageLocation& location) const {
    std::string path = config_.data_dir;
    if (!path.empty() && path.back() != '/') {
        path.push_back('/');
    }
    path.append(location.substr(0, 2));
    path.push_back('/');
    path.append(location);
    return path;
}

Result<StorageLocation> LocalObjectStore::Write(const std::string& data) {
    StorageLocation location = RandomHex(16);
    auto path = LocationToPath(location);

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        LOG_ERROR("Failed to create directory for {}: {}", path, ec.message());
        return Err<StorageLocation>(ErrorCode::kIOError, "Failed to create directory: " + ec.message());
    }

    std::string tmp_path = path + ".tmp-" + RandomHex(4);
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            LOG_ERROR("Failed to open file for writing: {}", tmp_path);
            return Err<StorageLocation>(ErrorCode::kIOError, "Failed to open file: " + tmp_path);
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            LOG_ERROR("Failed to write file: {}", tmp_path);
            std::filesystem::remove(tmp_path, ec);
            return Err<StorageLocation>(ErrorCode::kIOError, "Failed to write file: " + tmp_path);
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        LOG_ERROR("Failed to publish {}: {}", path, ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return Err<StorageLocation>(ErrorCode::kIOError, "Failed to rename: " + ec.message());
    }

    LOG_DEBUG("Written {} bytes to {}", data.size(), path);
    return location;
}

Result<uint64_t> LocalObjectStore::Size(const StorageLocation& location) {
    auto path = LocationToPath(location);
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Err<uint64_t>(ErrorCode::kNotFound, "No blob at " + location);
        }
        return Err<uint64_t>(ErrorCode::kIOError, "Failed to stat " + path + ": " + ec.message());
    }
    return static_cast<uint64_t>(size);
}

Result<std::unique_ptr<ByteStream>> LocalObjectStore::Read(
    const StorageLocation& location,
    const ByteRange& range
) {
    auto path = LocationToPath(location);

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && !ec) {
            return Err<std::unique_ptr<ByteStream>>(ErrorCode::kNotFound, "No blob at " + location);
        }
        LOG_ERROR("Failed to open file for reading: {}", path);
        return Err<std::unique_ptr<ByteStream>>(ErrorCode::kIOError, "Failed to open " + path);
    }

    if (range.length > 0) {
        file.seekg(static_cast<std::streamoff>(range.first), std::ios::beg);
        if (!file) {
            return Err<std::unique_ptr<ByteStream>>(ErrorCode::kInvalidRange, "Invalid offset");
        }
    }

    LOG_DEBUG("Open range {}+{} of {}", range.first, range.length, path);
    return std::unique_ptr<ByteStream>(
        std::make_unique<FileStream>(std::move(file), std::move(path), range));
}

Result<Void> LocalObjectStore::Remove(const StorageLocation& location) {
    auto path = LocationToPath(location);

    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        LOG_ERROR("Failed to delete file: {}", ec.message());
        return Err<Void>(ErrorCode::kIOError, "Failed to delete file: " + ec.message());
    }

    LOG_DEBUG("Deleted: {}", path);
    return Ok();
}

} // namespace cirrus::storage

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "cirrus/common/types.h"
#include "cirrus/common/result.h"

namespace cirrus::storage {

// ================================
// ByteStream - 单个字节范围的拉取式读取器
// ================================
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // 下一块，最多 max_bytes。空串表示范围已读完，出错后流不可再用
    virtual Result<std::string> Read(size_t max_bytes) = 0;

    // 尚未交付给调用方的字节数
    virtual uint64_t Remaining() const = 0;
};

// ================================
// ObjectStore - 不可变 blob 存储
//
// Write() 不复用位置，持有流的读者不受后续写入影响
// Remove() 不会使已打开的流失效
// ================================
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual Result<StorageLocation> Write(const std::string& data) = 0;

    virtual Result<uint64_t> Size(const StorageLocation& location) = 0;

    // 位置不存在返回 kNotFound，范围越界返回 kInvalidRange，存储故障返回 kIOError
    // 流式读取中发现的短读报告为 kIntegrityError
    virtual Result<std::unique_ptr<ByteStream>> Read(
        const StorageLocation& location,
        const ByteRange& range
    ) = 0;

    virtual Result<Void> Remove(const StorageLocation& location) = 0;
};

// ================================
// 内存存储 (测试、临时网关)
// ================================
class MemoryObjectStore : public ObjectStore {
public:
    MemoryObjectStore();
    ~MemoryObjectStore() override;

    Result<StorageLocation> Write(const std::string& data) override;
    Result<uint64_t> Size(const StorageLocation& location) override;
    Result<std::unique_ptr<ByteStream>> Read(
        const StorageLocation& location,
        const ByteRange& range
    ) override;
    Result<Void> Remove(const StorageLocation& location) override;

    // 替换某位置的内容，仅供测试构造损坏数据
    void OverwriteForTesting(const StorageLocation& location, const std::string& data);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// ================================
// 本地文件系统存储
//
// blob 位于 {data_dir}/{xx}/{location}，xx 为 location 前两个十六进制字符。
// 先写临时文件再 rename，一个位置要么不存在要么完整
// ================================
class LocalObjectStore : public ObjectStore {
public:
    struct Config {
        std::string data_dir;
    };

    explicit LocalObjectStore(Config config);
    ~LocalObjectStore() override = default;

    Result<StorageLocation> Write(const std::string& data) override;
    Result<uint64_t> Size(const StorageLocation& location) override;
    Result<std::unique_ptr<ByteStream>> Read(
        const StorageLocation& location,
        const ByteRange& range
    ) override;
    Result<Void> Remove(const StorageLocation& location) override;

    std::string LocationToPath(const StorageLocation& location) const;

private:
    Config config_;
};

} // namespace cirrus::storage

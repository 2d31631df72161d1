#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "cirrus/config/config_base.h"

namespace cirrus {

// ================================
// GatewayConfig - 网关进程启动时读取的全部配置
// ================================
class GatewayConfig : public config::ConfigBase<GatewayConfig> {
    CONFIG_ITEM(host, "0.0.0.0", config::checkers::checkNotEmpty<std::string>);
    CONFIG_ITEM(port, 8080, config::checkers::checkRange<int, 1, 65535>);
    CONFIG_ITEM(data_dir, "./cirrus-data", config::checkers::checkNotEmpty<std::string>);

    // "rocksdb" or "memory"
    CONFIG_ITEM(meta_backend, "rocksdb", [](const std::string& v) {
        return config::checkers::checkOneOf(v, {"rocksdb", "memory"});
    });
    // "local" or "memory"
    CONFIG_ITEM(store_backend, "local", [](const std::string& v) {
        return config::checkers::checkOneOf(v, {"local", "memory"});
    });

    CONFIG_ITEM(log_file, "");
    CONFIG_HOT_UPDATED_ITEM(log_level, "info", [](const std::string& v) {
        return config::checkers::checkOneOf(
            v, {"trace", "debug", "info", "warn", "error", "critical", "off"});
    });

    // 每个 body 分块从对象存储读取的字节数
    CONFIG_ITEM(stream_chunk_size, uint64_t{64 * 1024}, config::checkers::checkPositive<uint64_t>);
    // 连接发送缓冲超过该值时暂停填充
    CONFIG_HOT_UPDATED_ITEM(send_high_watermark, uint64_t{1024 * 1024},
                            config::checkers::checkPositive<uint64_t>);

    CONFIG_ITEM(default_content_type, "binary/octet-stream",
                config::checkers::checkNotEmpty<std::string>);

    // 逗号分隔，启动时创建缺失的桶
    CONFIG_ITEM(bootstrap_buckets, "");
    // 逗号分隔的 access key，为空则放行所有请求
    CONFIG_ITEM(access_keys, "");

public:
    // 解析 "--name=value" 参数，其他形式返回错误
    Result<Void> ParseFlags(const std::vector<std::string>& args);

    // "a,b,,c" -> {"a", "b", "c"}
    static std::vector<std::string> SplitList(const std::string& list);
};

} // namespace cirrus

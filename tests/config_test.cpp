#include <gtest/gtest.h>
#include <algorithm>
#include "cirrus/config/gateway_config.h"

namespace cirrus::test {

TEST(GatewayConfigTest, Defaults) {
    GatewayConfig config;
    EXPECT_EQ(config.host(), "0.0.0.0");
    EXPECT_EQ(config.port(), 8080);
    EXPECT_EQ(config.meta_backend(), "rocksdb");
    EXPECT_EQ(config.store_backend(), "local");
    EXPECT_EQ(config.stream_chunk_size(), 64u * 1024);
    EXPECT_EQ(config.default_content_type(), "binary/octet-stream");
    EXPECT_TRUE(config.validate().hasValue());
}

TEST(GatewayConfigTest, ParseFlags) {
    GatewayConfig config;
    auto res = config.ParseFlags({"--port=9000", "--meta-backend=memory",
                                  "--bootstrap-buckets=test-bucket,logs", "--log_level=debug"});
    ASSERT_TRUE(res.hasValue()) << res.error().ToString();
    EXPECT_EQ(config.port(), 9000);
    EXPECT_EQ(config.meta_backend(), "memory");
    EXPECT_EQ(config.log_level(), "debug");
    EXPECT_EQ(GatewayConfig::SplitList(config.bootstrap_buckets()),
              (std::vector<std::string>{"test-bucket", "logs"}));
}

TEST(GatewayConfigTest, RejectsBadValues) {
    GatewayConfig config;
    EXPECT_EQ(config.ParseFlags({"--port=70000"}).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(config.ParseFlags({"--port=http"}).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(config.ParseFlags({"--store-backend=s3"}).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(config.ParseFlags({"--no-such-item=1"}).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(config.ParseFlags({"positional"}).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(config.ParseFlags({"--port"}).code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(config.ParseFlags({"--stream-chunk-size=0"}).code(), ErrorCode::kInvalidArgument);
    // 校验失败不修改配置项
    EXPECT_EQ(config.port(), 8080);
}

TEST(GatewayConfigTest, SettersRunCheckers) {
    GatewayConfig config;
    EXPECT_FALSE(config.set_host(""));
    EXPECT_TRUE(config.set_host("127.0.0.1"));
    EXPECT_EQ(config.host(), "127.0.0.1");
    EXPECT_TRUE(config.set_send_high_watermark(4096));
    EXPECT_EQ(config.send_high_watermark(), 4096u);
}

TEST(GatewayConfigTest, DumpListsEveryItem) {
    GatewayConfig config;
    auto lines = config.dump();
    EXPECT_NE(std::find(lines.begin(), lines.end(), "port=8080"), lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), "data_dir=./cirrus-data"), lines.end());
    EXPECT_TRUE(std::is_sorted(lines.begin(), lines.end()));
}

TEST(GatewayConfigTest, SplitList) {
    EXPECT_TRUE(GatewayConfig::SplitList("").empty());
    EXPECT_EQ(GatewayConfig::SplitList("a,,b,"), (std::vector<std::string>{"a", "b"}));
}

} // namespace cirrus::test

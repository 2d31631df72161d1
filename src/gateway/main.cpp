// ================================
// cirrus-gateway: S3 GetObject 服务入口
// ================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <set>
#include <thread>
#include "cirrus/common/logger.h"
#include "cirrus/config/gateway_config.h"
#include "cirrus/metadata/metadata_index.h"
#include "cirrus/metadata/rocksdb_backend.h"
#include "cirrus/protocol/http_server.h"
#include "cirrus/protocol/s3_handler.h"
#include "cirrus/storage/backend_factory.h"

using namespace cirrus;

namespace {

std::atomic<bool> g_stop{false};

void SignalHandler(int) {
    g_stop = true;
}

void PrintUsage(const GatewayConfig& config) {
    std::cout << "Usage: cirrus-gateway [--name=value ...]\n\nOptions (current values):\n";
    for (const auto& line : config.dump()) {
        std::cout << "  --" << line << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    GatewayConfig config;

    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            PrintUsage(config);
            return 0;
        }
    }
    auto parsed = config.ParseFlags(args);
    if (parsed.hasError()) {
        std::cerr << parsed.error().message() << "\n";
        PrintUsage(config);
        return 1;
    }

    Logger::Instance()->Init(config.log_file(), config.log_level());
    for (const auto& line : config.dump()) {
        LOG_DEBUG("config {}", line);
    }

    // 元数据
    std::filesystem::path data_dir(config.data_dir());
    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        LOG_ERROR("Cannot create data dir {}: {}", data_dir.string(), ec.message());
        return 1;
    }

    metadata::RegisterMemoryBackend();
    metadata::RegisterRocksDBBackend();
    auto backend = metadata::MetadataBackendFactory::Instance().Create(
        config.meta_backend(), (data_dir / "metadata").string());
    if (backend.hasError()) {
        LOG_ERROR("Failed to open metadata backend: {}", backend.error().ToString());
        return 1;
    }
    auto index = std::make_shared<metadata::MetadataIndex>(std::move(backend).value());

    // 对象数据
    storage::RegisterBuiltinStores();
    std::shared_ptr<storage::ObjectStore> store = storage::StoreFactory::Instance().Create(
        storage::Config{config.store_backend(), (data_dir / "blobs").string()});
    if (!store) {
        LOG_ERROR("Unknown object store backend: {}", config.store_backend());
        return 1;
    }

    for (const auto& bucket : GatewayConfig::SplitList(config.bootstrap_buckets())) {
        auto res = index->CreateBucket(bucket);
        if (res.hasError() && res.code() != ErrorCode::kBucketAlreadyExists) {
            LOG_ERROR("Failed to create bucket {}: {}", bucket, res.error().ToString());
            return 1;
        }
    }

    std::shared_ptr<s3::Authorizer> authorizer;
    auto keys = GatewayConfig::SplitList(config.access_keys());
    if (keys.empty()) {
        authorizer = std::make_shared<s3::AllowAllAuthorizer>();
    } else {
        authorizer = std::make_shared<s3::AccessKeyAuthorizer>(
            std::set<std::string>(keys.begin(), keys.end()));
    }

    s3::S3Handler::Options options;
    options.default_content_type = config.default_content_type();
    auto handler = std::make_shared<s3::S3Handler>(index, store, authorizer, options);

    HttpServer server(config, handler);
    if (!server.Start()) {
        return 1;
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    LOG_INFO("cirrus-gateway ready (meta={}, store={}, data_dir={})",
             config.meta_backend(), config.store_backend(), data_dir.string());
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.Stop();
    LOG_INFO("cirrus-gateway exited");
    return 0;
}

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "cirrus/config/gateway_config.h"
#include "cirrus/protocol/s3_handler.h"

// mongoose 类型 (C 库，全局命名空间)
struct mg_mgr;
struct mg_connection;

namespace cirrus {

// ================================
// HttpServer - S3 over HTTP/1.1 (mongoose)
//
// 单个 poll 线程持有所有连接。对象 body 按 stream_chunk_size 分块推送，
// 连接发送缓冲不超过 send_high_watermark
// ================================
class HttpServer {
public:
    HttpServer(const GatewayConfig& config, std::shared_ptr<s3::S3Handler> handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool Start();
    void Stop();

    bool IsRunning() const { return running_; }

    static const char* ReasonPhrase(int status_code);

    // resp 的状态行和头部，以空行结尾
    static std::string FormatHead(const s3::S3Response& resp);

private:
    class Impl;

    const GatewayConfig& config_;
    std::shared_ptr<s3::S3Handler> handler_;
    std::atomic<bool> running_{false};
    std::unique_ptr<Impl> impl_;

    // 签名须与 mg_event_handler_t 一致
    static void EventHandler(mg_connection* nc, int ev, void* ev_data);
};

} // namespace cirrus

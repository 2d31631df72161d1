// ================================
// HTTP 服务器实现 (mongoose)
// ================================

#include "cirrus/protocol/http_server.h"
#include "cirrus/common/logger.h"
#include "mongoose.h"
#include <sstream>
#include <thread>
#include <unordered_map>

namespace cirrus {

namespace {

// 写入连接的发送缓冲
class ConnectionSink : public s3::BodySink {
public:
    explicit ConnectionSink(mg_connection* c) : c_(c) {}

    bool Write(std::string_view data) override {
        return mg_send(c_, data.data(), data.size());
    }

private:
    mg_connection* c_;
};

struct Transfer {
    std::unique_ptr<storage::ByteStream> stream;
    std::string resource;
};

} // namespace

// ================================
// HttpServer::Impl
// ================================
class HttpServer::Impl {
public:
    mg_mgr mgr_{};
    std::thread poll_thread_;
    std::atomic<bool> running_{false};
    // 正在发送的 body，按连接 id 索引，仅 poll 线程访问
    std::unordered_map<unsigned long, Transfer> transfers_;
};

HttpServer::HttpServer(const GatewayConfig& config, std::shared_ptr<s3::S3Handler> handler)
    : config_(config), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    Stop();
}

bool HttpServer::Start() {
    if (running_) {
        LOG_WARN("HTTP server already running");
        return true;
    }

    impl_ = std::make_unique<Impl>();
    mg_mgr_init(&impl_->mgr_);

    std::ostringstream addr;
    addr << "http://" << config_.host() << ":" << config_.port();
    std::string listen_addr = addr.str();

    mg_connection* nc = mg_http_listen(&impl_->mgr_, listen_addr.c_str(), EventHandler, this);
    if (!nc) {
        LOG_ERROR("HTTP server failed to listen on {}", listen_addr);
        mg_mgr_free(&impl_->mgr_);
        impl_.reset();
        return false;
    }

    running_ = true;
    impl_->running_ = true;
    LOG_INFO("HTTP server listening on {}", listen_addr);

    impl_->poll_thread_ = std::thread([this]() {
        while (impl_->running_) {
            mg_mgr_poll(&impl_->mgr_, 100);
        }
    });
    return true;
}

void HttpServer::Stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping HTTP server...");
    running_ = false;

    if (impl_) {
        impl_->running_ = false;
        if (impl_->poll_thread_.joinable()) {
            impl_->poll_thread_.join();
        }
        impl_->transfers_.clear();
        mg_mgr_free(&impl_->mgr_);
        impl_.reset();
    }
    LOG_INFO("HTTP server stopped");
}

const char* HttpServer::ReasonPhrase(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 412: return "Precondition Failed";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "Unknown";
    }
}

std::string HttpServer::FormatHead(const s3::S3Response& resp) {
    std::ostringstream head;
    head << "HTTP/1.1 " << resp.status_code << " " << ReasonPhrase(resp.status_code) << "\r\n";
    head << "Server: cirrus\r\n";
    for (const auto& [name, value] : resp.headers) {
        head << name << ": " << value << "\r\n";
    }
    head << "\r\n";
    return head.str();
}

// ================================
// 事件处理 (签名须与 mg_event_handler_t 一致)
// ================================
void HttpServer::EventHandler(mg_connection* nc, int ev, void* ev_data) {
    auto* self = static_cast<HttpServer*>(nc->fn_data);
    if (self == nullptr || !self->impl_) return;
    auto& transfers = self->impl_->transfers_;

    // 为正在发送 body 的连接补充发送缓冲
    auto pump = [self, &transfers](mg_connection* c) {
        auto it = transfers.find(c->id);
        if (it == transfers.end()) return;

        size_t high_watermark = self->config_.send_high_watermark();
        size_t chunk = self->config_.stream_chunk_size();
        ConnectionSink sink(c);
        while (c->send.len < high_watermark) {
            switch (s3::ResponseEncoder::PumpBody(*it->second.stream, sink, chunk)) {
                case s3::PumpStatus::kMore:
                    continue;
                case s3::PumpStatus::kDone:
                    transfers.erase(it);
                    return;
                case s3::PumpStatus::kFailed:
                    // Content-Length 已经发出，只能断开连接
                    LOG_ERROR("Aborting response body for {}", it->second.resource);
                    c->is_closing = 1;
                    transfers.erase(it);
                    return;
            }
        }
    };

    switch (ev) {
    case MG_EV_HTTP_MSG: {
        auto* hm = static_cast<mg_http_message*>(ev_data);

        if (transfers.count(nc->id)) {
            LOG_WARN("Pipelined request while a body is in flight, closing connection");
            nc->is_closing = 1;
            break;
        }

        s3::S3Request req;
        req.method.assign(hm->method.buf, hm->method.len);
        req.uri.assign(hm->uri.buf, hm->uri.len);
        if (hm->query.len > 0) {
            req.uri += "?";
            req.uri.append(hm->query.buf, hm->query.len);
        }
        req.body.assign(hm->body.buf, hm->body.len);
        for (int i = 0; i < MG_MAX_HTTP_HEADERS && hm->headers[i].name.len > 0; i++) {
            std::string name(hm->headers[i].name.buf, hm->headers[i].name.len);
            std::string value(hm->headers[i].value.buf, hm->headers[i].value.len);
            req.headers[name] = value;
        }

        s3::S3Response resp = self->handler_->Handle(req);

        std::string head = FormatHead(resp);
        mg_send(nc, head.data(), head.size());
        if (!resp.body.empty()) {
            mg_send(nc, resp.body.data(), resp.body.size());
        }
        if (resp.stream) {
            transfers[nc->id] = Transfer{std::move(resp.stream), req.Resource()};
            pump(nc);
        }
        break;
    }
    case MG_EV_WRITE:
    case MG_EV_POLL:
        pump(nc);
        break;
    case MG_EV_CLOSE:
        transfers.erase(nc->id);
        break;
    default:
        break;
    }
}

} // namespace cirrus

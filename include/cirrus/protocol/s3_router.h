// S3 请求路由: path-style 寻址 /{bucket}/{key}?{query}
#pragma once

#include "cirrus/protocol/s3_types.h"
#include <cctype>

namespace cirrus {
namespace s3 {

class S3Router {
public:
    static void ParseRequest(S3Request& req) {
        ParseUri(req);
        ParseQueryString(req);
        DetermineOperation(req);
    }

    // 百分号解码，'+' 只在查询串中表示空格
    static std::string UrlDecode(const std::string& str, bool plus_is_space) {
        std::string result;
        for (size_t i = 0; i < str.size(); ++i) {
            if (str[i] == '%' && i + 2 < str.size() &&
                std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
                std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
                result += static_cast<char>(HexValue(str[i + 1]) * 16 + HexValue(str[i + 2]));
                i += 2;
            } else if (plus_is_space && str[i] == '+') result += ' ';
            else result += str[i];
        }
        return result;
    }

private:
    static int HexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    }

    static void ParseUri(S3Request& req) {
        std::string path = req.uri;
        size_t query_pos = path.find('?');
        if (query_pos != std::string::npos) {
            req.query_string = path.substr(query_pos + 1);
            path = path.substr(0, query_pos);
        }
        if (!path.empty() && path[0] == '/') path = path.substr(1);

        if (path.empty()) {
            req.bucket_name = "";
            req.object_key = "";
        } else {
            size_t slash_pos = path.find('/');
            if (slash_pos == std::string::npos) {
                req.bucket_name = UrlDecode(path, false);
                req.object_key = "";
            } else {
                req.bucket_name = UrlDecode(path.substr(0, slash_pos), false);
                req.object_key = UrlDecode(path.substr(slash_pos + 1), false);
            }
        }
    }

    static void ParseQueryString(S3Request& req) {
        if (req.query_string.empty()) return;
        const std::string& qs = req.query_string;
        size_t pos = 0;
        while (pos < qs.size()) {
            size_t eq_pos = qs.find('=', pos);
            size_t amp_pos = qs.find('&', pos);
            std::string key, value;
            if (eq_pos != std::string::npos && (amp_pos == std::string::npos || eq_pos < amp_pos)) {
                key = qs.substr(pos, eq_pos - pos);
                size_t val_end = (amp_pos != std::string::npos) ? amp_pos : qs.size();
                value = qs.substr(eq_pos + 1, val_end - eq_pos - 1);
            } else {
                size_t key_end = (amp_pos != std::string::npos) ? amp_pos : qs.size();
                key = qs.substr(pos, key_end - pos);
            }
            if (!key.empty()) req.params[UrlDecode(key, true)] = UrlDecode(value, true);
            if (amp_pos == std::string::npos) break;
            pos = amp_pos + 1;
        }
    }

    static void DetermineOperation(S3Request& req) {
        bool has_bucket = !req.bucket_name.empty();
        bool has_key = !req.object_key.empty();

        if (req.method == "GET") {
            // 不提供服务级和桶级列举
            if (!has_bucket || !has_key) req.op = S3Op::UNSUPPORTED;
            else req.op = S3Op::GET_OBJECT;
        } else if (req.method == "PUT") {
            if (!has_bucket) req.op = S3Op::UNKNOWN;
            else if (!has_key) {
                req.op = req.HasParam("versioning") ? S3Op::PUT_BUCKET_VERSIONING
                                                    : S3Op::CREATE_BUCKET;
            } else {
                req.op = !req.GetHeader("x-amz-copy-source").empty() ? S3Op::UNSUPPORTED
                                                                      : S3Op::PUT_OBJECT;
            }
        } else if (req.method == "DELETE") {
            if (!has_bucket) req.op = S3Op::UNKNOWN;
            else if (!has_key) req.op = S3Op::DELETE_BUCKET;
            else req.op = S3Op::DELETE_OBJECT;
        } else if (req.method == "HEAD") {
            if (!has_bucket) req.op = S3Op::UNKNOWN;
            else if (!has_key) req.op = S3Op::HEAD_BUCKET;
            else req.op = S3Op::HEAD_OBJECT;
        } else if (req.method == "POST") {
            req.op = S3Op::UNSUPPORTED;
        } else {
            req.op = S3Op::UNKNOWN;
        }
    }
};

} // namespace s3
} // namespace cirrus

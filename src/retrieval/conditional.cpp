// ================================
// 条件请求与 Range 判定
// ================================

#include "cirrus/retrieval/conditional.h"
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <limits>
#include <strings.h>
#include <time.h>

namespace cirrus::retrieval {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// 去掉弱标记前缀和引号
std::string OpaqueTag(std::string tag) {
    tag = Trim(tag);
    if (tag.size() >= 2 && (tag[0] == 'W' || tag[0] == 'w') && tag[1] == '/') {
        tag = tag.substr(2);
    }
    if (tag.size() >= 2 && tag.front() == '"' && tag.back() == '"') {
        tag = tag.substr(1, tag.size() - 2);
    }
    return tag;
}

const std::string* FindHeader(const HeaderMap& headers, const char* name) {
    auto it = headers.find(name);
    return it == headers.end() ? nullptr : &it->second;
}

// 无符号十进制，拒绝空串和溢出
bool ParseOffset(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

} // namespace

bool EtagListMatches(const std::string& header, const std::string& etag) {
    std::string want = OpaqueTag(etag);
    size_t pos = 0;
    while (pos <= header.size()) {
        size_t comma = header.find(',', pos);
        if (comma == std::string::npos) comma = header.size();
        std::string item = Trim(header.substr(pos, comma - pos));
        if (item == "*") return true;
        if (!item.empty() && OpaqueTag(item) == want) return true;
        pos = comma + 1;
    }
    return false;
}

std::optional<Timestamp> ParseHttpDate(const std::string& text) {
    static const char* kFormats[] = {
        "%a, %d %b %Y %H:%M:%S GMT",   // IMF-fixdate
        "%A, %d-%b-%y %H:%M:%S GMT",   // RFC 850
        "%a %b %e %H:%M:%S %Y",        // asctime
        "%Y-%m-%dT%H:%M:%SZ",          // ISO 8601, sent by some SDKs
        "%Y-%m-%dT%H:%M:%S.000Z",
    };

    std::string s = Trim(text);
    for (const char* fmt : kFormats) {
        std::tm tm{};
        const char* rest = strptime(s.c_str(), fmt, &tm);
        if (rest && *rest == '\0') {
            time_t t = timegm(&tm);
            if (t < 0) return std::nullopt;
            return static_cast<Timestamp>(t);
        }
    }
    return std::nullopt;
}

std::string FormatHttpDate(Timestamp ts) {
    static const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    auto t = static_cast<time_t>(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    // 手写星期和月份名: strftime 受进程 locale 影响
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

RangeResolution ResolveRange(const std::string& header, uint64_t size) {
    RangeResolution whole;
    std::string value = Trim(header);

    auto eq = value.find('=');
    if (eq == std::string::npos) return whole;
    std::string unit = Trim(value.substr(0, eq));
    if (unit.size() != 5 || strncasecmp(unit.c_str(), "bytes", 5) != 0) return whole;

    std::string set = Trim(value.substr(eq + 1));
    if (set.find(',') != std::string::npos) return whole;   // 不支持多段 range

    auto dash = set.find('-');
    if (dash == std::string::npos) return whole;
    std::string a = Trim(set.substr(0, dash));
    std::string b = Trim(set.substr(dash + 1));

    RangeResolution r;
    if (a.empty()) {
        // 后缀形式: 最后 N 字节
        uint64_t n;
        if (!ParseOffset(b, n)) return whole;
        if (n == 0 || size == 0) {
            r.kind = RangeResolution::Kind::kUnsatisfiable;
            return r;
        }
        r.kind = RangeResolution::Kind::kPartial;
        r.first = n >= size ? 0 : size - n;
        r.last = size - 1;
        return r;
    }

    uint64_t first;
    if (!ParseOffset(a, first)) return whole;
    uint64_t last = std::numeric_limits<uint64_t>::max();
    if (!b.empty()) {
        if (!ParseOffset(b, last)) return whole;
        if (last < first) return whole;
    }

    if (first >= size) {
        r.kind = RangeResolution::Kind::kUnsatisfiable;
        return r;
    }
    r.kind = RangeResolution::Kind::kPartial;
    r.first = first;
    r.last = last >= size ? size - 1 : last;
    return r;
}

Decision EvaluateRequest(const metadata::ObjectMeta& meta, const HeaderMap& headers) {
    // 412 gates
    if (auto* if_match = FindHeader(headers, "If-Match")) {
        if (!EtagListMatches(*if_match, meta.etag)) {
            return PreconditionFailed{"If-Match"};
        }
    } else if (auto* ius = FindHeader(headers, "If-Unmodified-Since")) {
        auto date = ParseHttpDate(*ius);
        if (date && meta.last_modified > *date) {
            return PreconditionFailed{"If-Unmodified-Since"};
        }
    }

    // 304 gates
    if (auto* inm = FindHeader(headers, "If-None-Match")) {
        if (EtagListMatches(*inm, meta.etag)) {
            return NotModified{};
        }
    } else if (auto* ims = FindHeader(headers, "If-Modified-Since")) {
        auto date = ParseHttpDate(*ims);
        if (date && meta.last_modified <= *date) {
            return NotModified{};
        }
    }

    if (auto* range = FindHeader(headers, "Range")) {
        auto r = ResolveRange(*range, meta.size);
        switch (r.kind) {
            case RangeResolution::Kind::kPartial:
                return PartialContent{r.first, r.last};
            case RangeResolution::Kind::kUnsatisfiable:
                return RangeNotSatisfiable{meta.size};
            case RangeResolution::Kind::kWhole:
                break;
        }
    }
    return FullContent{};
}

} // namespace cirrus::retrieval

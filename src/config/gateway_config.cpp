#include "cirrus/config/gateway_config.h"

namespace cirrus {

Result<Void> GatewayConfig::ParseFlags(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (arg.rfind("--", 0) != 0) {
            return Err<Void>(ErrorCode::kInvalidArgument, "Unexpected argument: " + arg);
        }
        auto eq = arg.find('=');
        if (eq == std::string::npos) {
            return Err<Void>(ErrorCode::kInvalidArgument, "Expected --name=value: " + arg);
        }
        // 参数用连字符，配置项用下划线
        std::string name = arg.substr(2, eq - 2);
        for (auto& c : name) {
            if (c == '-') c = '_';
        }
        auto res = set(name, arg.substr(eq + 1));
        if (res.hasError()) return res;
    }
    return validate();
}

std::vector<std::string> GatewayConfig::SplitList(const std::string& all) {
    std::vector<std::string> names;
    size_t pos = 0;
    while (pos <= all.size()) {
        size_t comma = all.find(',', pos);
        if (comma == std::string::npos) comma = all.size();
        std::string name = all.substr(pos, comma - pos);
        if (!name.empty()) names.push_back(name);
        pos = comma + 1;
    }
    return names;
}

} // namespace cirrus

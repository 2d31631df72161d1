// ================================
// 日志初始化 (spdlog)
// ================================

#include "cirrus/common/logger.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cirrus {

Logger* Logger::Instance() {
    static Logger instance;
    return &instance;
}

void Logger::Init(const std::string& log_file, const std::string& level) {
    // 重复 Init 会替换同名的已注册 logger
    spdlog::drop("cirrus");
    logger_.reset();

    std::shared_ptr<spdlog::logger> logger;
    if (!log_file.empty()) {
        try {
            logger = spdlog::basic_logger_mt("cirrus", log_file);
        } catch (const spdlog::spdlog_ex& ex) {
            // 回退到 stderr
            logger = spdlog::stderr_color_mt("cirrus");
            logger->warn("Cannot open log file {}: {}", log_file, ex.what());
        }
    } else {
        logger = spdlog::stdout_color_mt("cirrus");
    }

    logger->set_level(spdlog::level::from_str(level));
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%f %t [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    logger_ = logger;
    spdlog::set_default_logger(logger_);
}

} // namespace cirrus

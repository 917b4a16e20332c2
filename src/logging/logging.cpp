#include "logging/logging.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace kild {

namespace {

constexpr size_t DAEMON_LOG_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t DAEMON_LOG_MAX_FILES = 3;

}

void init_cli_logging(const std::string& level) {
    auto logger = spdlog::get("kild");
    if (!logger) {
        logger = spdlog::stderr_color_mt("kild");
    }
    logger->set_pattern("%^[%l]%$ %v");
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);
}

void init_daemon_logging(const std::filesystem::path& log_file, const std::string& level, bool foreground) {
    std::vector<spdlog::sink_ptr> sinks;

    std::error_code ec;
    std::filesystem::create_directories(log_file.parent_path(), ec);
    try {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), DAEMON_LOG_MAX_BYTES, DAEMON_LOG_MAX_FILES));
    } catch (const spdlog::spdlog_ex& e) {
        foreground = true;
        spdlog::warn("daemon.log.file_sink_failed path={} error={}", log_file.string(), e.what());
    }
    if (foreground) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("kild-daemon", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
}

}

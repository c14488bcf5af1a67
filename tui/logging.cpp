#include "logging.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cstdlib>
#include <stdexcept>

namespace gcm {

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str returns "off" for anything it does not know
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

void initLogging(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create " + dir.string() + ": " + ec.message());
    }

    try {
        auto logger = spdlog::basic_logger_mt("gcm", (dir / "gcm-tui.log").string());
        const char* level = std::getenv("GCM_LOG_LEVEL");
        logger->set_level(parseLogLevel(level ? level : "info"));
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error(std::string("Failed to open log file: ") + e.what());
    }
}

}  // namespace gcm

#include "log.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace logging {
    static constexpr const char* NULL_LOGGER_NAME = "qbo_link.null";

    Logger null_logger() {
        static const Logger logger = std::make_shared<spdlog::logger>(NULL_LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
        return logger;
    }

    Logger console_logger(const std::string& name, spdlog::level::level_enum level) {
        Logger logger = spdlog::get(name);
        if (!logger) {
            logger = spdlog::stdout_color_mt(name);
        }
        logger->set_level(level);
        return logger;
    }

    Logger or_null(Logger logger) { return logger ? std::move(logger) : null_logger(); }
}  // namespace logging

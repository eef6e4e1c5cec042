#ifndef QBO_LINK_LOG_HPP
#define QBO_LINK_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace logging {
    using Logger = std::shared_ptr<spdlog::logger>;

    // Discards everything. Default wherever no logger is injected.
    Logger null_logger();

    // Named stdout logger, created on first use and shared afterwards.
    Logger console_logger(const std::string& name, spdlog::level::level_enum level = spdlog::level::info);

    // Falls back to null_logger() when logger is empty.
    Logger or_null(Logger logger);
}  // namespace logging

#endif

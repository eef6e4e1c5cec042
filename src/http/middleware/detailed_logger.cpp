#include "detailed_logger.hpp"

#include <exception>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::middleware {
    static constexpr const char* FILTERED = "[FILTERED]";

    DetailedLogger::DetailedLogger(logging::Logger logger, std::string tag) : logger_(logging::or_null(std::move(logger))), tag_(std::move(tag)) {}

    std::string DetailedLogger::format_headers(const http::model::Headers& headers) {
        std::string out;
        for (const auto& [name, value] : headers) {
            if (!out.empty()) {
                out += ", ";
            }
            out += name + ": " + (string_utils::iequals(name, constants::AUTHORIZATION) ? FILTERED : value);
        }
        return "{" + out + "}";
    }

    http::model::Response DetailedLogger::call(http::model::Request& req, const Next& next) const {
        logger_->info("{} {} {}", tag_, string_utils::to_upper(req.method_), req.url_);
        logger_->debug("{} request headers={} body={}", tag_, format_headers(req.headers_), req.body_);

        try {
            http::model::Response resp = next(req);
            logger_->info("{} HTTP {}", tag_, resp.status_);
            logger_->debug("{} response headers={} body={}", tag_, format_headers(resp.headers_), resp.body_);
            return resp;
        } catch (const std::exception& e) {
            logger_->error("{} {} {} failed: {}", tag_, string_utils::to_upper(req.method_), req.url_, e.what());
            throw;
        }
    }
}  // namespace http::middleware

#ifndef QBO_LINK_DETAILED_LOGGER_HPP
#define QBO_LINK_DETAILED_LOGGER_HPP

#include <string>

#include "../../log/log.hpp"
#include "interface.hpp"

namespace http::middleware {
    // Request line and status at info, headers and bodies at debug, failures at error.
    // Sits outermost so it sees the request exactly as the caller built it and every error
    // raised further in.
    class DetailedLogger : public IMiddleware {
       public:
        DetailedLogger(logging::Logger logger, std::string tag);

        [[nodiscard]] std::string_view name() const override { return "detailed_logger"; }
        http::model::Response call(http::model::Request& req, const Next& next) const override;

       private:
        static std::string format_headers(const http::model::Headers& headers);

        logging::Logger logger_;
        std::string tag_;
    };
}  // namespace http::middleware

#endif

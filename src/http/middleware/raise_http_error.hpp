#ifndef QBO_LINK_RAISE_HTTP_ERROR_HPP
#define QBO_LINK_RAISE_HTTP_ERROR_HPP

#include "interface.hpp"

namespace http::middleware {
    // Turns any non-2xx response into http::http_error::HttpError.
    class RaiseHttpError : public IMiddleware {
       public:
        [[nodiscard]] std::string_view name() const override { return "raise_http_error"; }
        http::model::Response call(http::model::Request& req, const Next& next) const override;
    };
}  // namespace http::middleware

#endif

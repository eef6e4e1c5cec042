#include "bearer_token.hpp"

#include "../../utils/constants.hpp"

namespace http::middleware {
    BearerToken::BearerToken(std::string access_token) : access_token_(std::move(access_token)) {}

    http::model::Response BearerToken::call(http::model::Request& req, const Next& next) const {
        req.headers_[constants::AUTHORIZATION] = "Bearer " + access_token_;
        return next(req);
    }
}  // namespace http::middleware

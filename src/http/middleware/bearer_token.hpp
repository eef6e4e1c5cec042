#ifndef QBO_LINK_BEARER_TOKEN_HPP
#define QBO_LINK_BEARER_TOKEN_HPP

#include <string>

#include "interface.hpp"

namespace http::middleware {
    // OAuth2: "Authorization: Bearer <access token>".
    class BearerToken : public IMiddleware {
       public:
        explicit BearerToken(std::string access_token);

        [[nodiscard]] std::string_view name() const override { return "oauth2"; }
        http::model::Response call(http::model::Request& req, const Next& next) const override;

       private:
        std::string access_token_;
    };
}  // namespace http::middleware

#endif

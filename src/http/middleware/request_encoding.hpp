#ifndef QBO_LINK_REQUEST_ENCODING_HPP
#define QBO_LINK_REQUEST_ENCODING_HPP

#include <string>

#include "interface.hpp"

namespace http::middleware {
    // Serializes Request::form_ as application/x-www-form-urlencoded when the request has no
    // body yet and does not already declare some other content type.
    class UrlEncodedRequest : public IMiddleware {
       public:
        [[nodiscard]] std::string_view name() const override { return "url_encoded"; }
        http::model::Response call(http::model::Request& req, const Next& next) const override;
    };

    // Serializes Request::parts_ as multipart/form-data under the same conditions.
    class MultipartRequest : public IMiddleware {
       public:
        MultipartRequest();
        explicit MultipartRequest(std::string boundary);

        [[nodiscard]] std::string_view name() const override { return "multipart"; }
        http::model::Response call(http::model::Request& req, const Next& next) const override;

        [[nodiscard]] const std::string& boundary() const { return boundary_; }
        [[nodiscard]] std::string encode(const std::vector<http::model::Part>& parts) const;

       private:
        std::string boundary_;
    };
}  // namespace http::middleware

#endif

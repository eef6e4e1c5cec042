#ifndef QBO_LINK_HTTP_ERROR_HPP
#define QBO_LINK_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "../model/model.hpp"

namespace http::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    enum class ErrorKind {
        BAD_REQUEST,
        UNAUTHORIZED,
        FORBIDDEN,
        NOT_FOUND,
        TOO_MANY_REQUESTS,
        INTERNAL_SERVER_ERROR,
        SERVICE_UNAVAILABLE,
        OTHER,
    };

    // One entry of a QuickBooks {"Fault": {"Error": [...]}} body.
    struct FaultDetail {
        std::string message_;
        std::string detail_;
        std::string code_;
        std::string element_;
    };

    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        ErrorKind kind_ = ErrorKind::OTHER;
        std::string fault_type_;
        std::vector<FaultDetail> faults_;

        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);

        // Classifies the status and pulls fault details out of a JSON error body.
        static HttpError from_response(const http::model::Response &resp);
    };

    // Raised instead of degrading when strict response parsing is requested.
    struct ResponseParseError : public std::runtime_error {
        std::string entity_;
        std::string body_preview_;

        explicit ResponseParseError(std::string entity, std::string preview, const std::string &msg);
    };

    ErrorKind classify_status(long status);

    const char *to_string(ErrorKind kind);
}  // namespace http::http_error

#endif

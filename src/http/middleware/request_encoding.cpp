#include "request_encoding.hpp"

#include <random>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::middleware {
    namespace {
        constexpr const char* BOUNDARY_PREFIX = "-----------QboLinkMultipartPost-";
        constexpr const char* CRLF = "\r\n";

        // True when the request's Content-Type is absent or starts with expected.
        bool accepts_content_type(const http::model::Request& req, const char* expected) {
            auto content_type = http::model::find_header(req.headers_, constants::CONTENT_TYPE);
            return !content_type || string_utils::ieq_prefix(content_type->c_str(), content_type->size(), expected);
        }

        std::string random_boundary() {
            std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<unsigned long long> d;
            static constexpr const char* HEX = "0123456789abcdef";

            std::string out = BOUNDARY_PREFIX;
            for (unsigned long long v = d(rng); v != 0; v >>= 4U) {
                out.push_back(HEX[v & 0x0FU]);
            }
            return out;
        }
    }  // namespace

    http::model::Response UrlEncodedRequest::call(http::model::Request& req, const Next& next) const {
        if (!req.form_.empty() && req.body_.empty() && accepts_content_type(req, constants::FORM_CONTENT_TYPE)) {
            req.body_ = string_utils::build_query(req.form_);
            req.headers_[constants::CONTENT_TYPE] = constants::FORM_CONTENT_TYPE;
        }
        return next(req);
    }

    MultipartRequest::MultipartRequest() : boundary_(random_boundary()) {}

    MultipartRequest::MultipartRequest(std::string boundary) : boundary_(std::move(boundary)) {}

    std::string MultipartRequest::encode(const std::vector<http::model::Part>& parts) const {
        std::string body;
        for (const auto& part : parts) {
            body += "--" + boundary_ + CRLF;
            body += "Content-Disposition: form-data; name=\"" + part.name_ + "\"";
            if (!part.filename_.empty()) {
                body += "; filename=\"" + part.filename_ + "\"";
            }
            body += CRLF;
            if (!part.content_type_.empty()) {
                body += std::string(constants::CONTENT_TYPE) + ": " + part.content_type_ + CRLF;
            }
            body += CRLF;
            body += part.data_;
            body += CRLF;
        }
        body += "--" + boundary_ + "--" + CRLF;
        return body;
    }

    http::model::Response MultipartRequest::call(http::model::Request& req, const Next& next) const {
        if (!req.parts_.empty() && req.body_.empty() && accepts_content_type(req, constants::MULTIPART_CONTENT_TYPE)) {
            req.body_ = encode(req.parts_);
            req.headers_[constants::CONTENT_TYPE] = std::string(constants::MULTIPART_CONTENT_TYPE) + "; boundary=" + boundary_;
        }
        return next(req);
    }
}  // namespace http::middleware

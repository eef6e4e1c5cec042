#include "http_error.hpp"

#include <simdjson.h>

#include <stdexcept>
#include <string>

#include "../../json/json_value.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../client/curl_easy.hpp"

namespace http::http_error {
    namespace {
        std::string member_or_empty(const json::JsonValue &obj, const char *key) {
            auto value = obj.find(key);
            if (!value || !value->is_string()) {
                return {};
            }
            return value->as_string();
        }

        void read_faults(const http::model::Response &resp, std::string &fault_type, std::vector<FaultDetail> &faults) {
            auto content_type = http::model::find_header(resp.headers_, constants::CONTENT_TYPE);
            if (!content_type || !string_utils::icontains(*content_type, "json")) {
                return;
            }

            const json::JsonValue doc = json::JsonValue::parse(resp.body_);
            if (!doc.is_object()) {
                return;
            }
            auto fault = doc.find("Fault");
            if (!fault || !fault->is_object()) {
                return;
            }

            fault_type = member_or_empty(*fault, "type");

            auto errors = fault->find("Error");
            if (!errors || !errors->is_array()) {
                return;
            }
            for (std::size_t i = 0; i < errors->size(); ++i) {
                const json::JsonValue entry = errors->at(i);
                if (!entry.is_object()) {
                    continue;
                }
                faults.push_back(FaultDetail{
                    .message_ = member_or_empty(entry, "Message"),
                    .detail_ = member_or_empty(entry, "Detail"),
                    .code_ = member_or_empty(entry, "code"),
                    .element_ = member_or_empty(entry, "element"),
                });
            }
        }
    }  // namespace

    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    HttpError HttpError::from_response(const http::model::Response &resp) {
        std::string fault_type;
        std::vector<FaultDetail> faults;
        try {
            read_faults(resp, fault_type, faults);
        } catch (const simdjson::simdjson_error &) {
            // Error bodies are not guaranteed to be JSON; the status alone still classifies it.
            faults.clear();
        }

        std::string msg = "HTTP request failed with status " + std::to_string(resp.status_);
        if (!faults.empty() && !faults.front().message_.empty()) {
            msg += ": " + faults.front().message_;
            if (!faults.front().detail_.empty()) {
                msg += " (" + faults.front().detail_ + ")";
            }
        }

        HttpError error(resp.status_, resp.effective_url_, resp.body_.substr(0, ERROR_MESSAGE_LENGTH), msg);
        error.kind_ = classify_status(resp.status_);
        error.fault_type_ = std::move(fault_type);
        error.faults_ = std::move(faults);
        return error;
    }

    ResponseParseError::ResponseParseError(std::string entity,
                                           std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                                           const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), entity_(std::move(entity)), body_preview_(std::move(preview)) {}

    ErrorKind classify_status(long status) {
        using http::client::HttpStatusCode;
        switch (static_cast<HttpStatusCode>(status)) {
            case HttpStatusCode::BAD_REQUEST:
                return ErrorKind::BAD_REQUEST;
            case HttpStatusCode::UNAUTHORIZED:
                return ErrorKind::UNAUTHORIZED;
            case HttpStatusCode::FORBIDDEN:
                return ErrorKind::FORBIDDEN;
            case HttpStatusCode::NOT_FOUND:
                return ErrorKind::NOT_FOUND;
            case HttpStatusCode::TOO_MANY_REQUESTS:
                return ErrorKind::TOO_MANY_REQUESTS;
            case HttpStatusCode::INTERNAL_SERVER_ERROR:
                return ErrorKind::INTERNAL_SERVER_ERROR;
            case HttpStatusCode::SERVICE_UNAVAILABLE:
                return ErrorKind::SERVICE_UNAVAILABLE;
            default:
                return ErrorKind::OTHER;
        }
    }

    const char *to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::BAD_REQUEST:
                return "BadRequest";
            case ErrorKind::UNAUTHORIZED:
                return "Unauthorized";
            case ErrorKind::FORBIDDEN:
                return "Forbidden";
            case ErrorKind::NOT_FOUND:
                return "NotFound";
            case ErrorKind::TOO_MANY_REQUESTS:
                return "TooManyRequests";
            case ErrorKind::INTERNAL_SERVER_ERROR:
                return "InternalServerError";
            case ErrorKind::SERVICE_UNAVAILABLE:
                return "ServiceUnavailable";
            case ErrorKind::OTHER:
                break;
        }
        return "HttpError";
    }
}  // namespace http::http_error

#include "curl_easy.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr long TIMEOUT_MS = 60'000L;
        static constexpr const char* USER_AGENT = "qbo-link/1.0";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long POST = 0L;
        static constexpr long UPLOAD = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
    };

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const http::model::Headers& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            const std::string line = name + ": " + value;
            headers_ = curl_slist_append(headers_, line.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(CURLOPT_TIMEOUT_MS, CurlDefaults::TIMEOUT_MS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        last_response_headers_.clear();
        body.clear();

        // Always set these per request (don't rely on old values)
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);

        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_UPLOAD, CurlDefaults::UPLOAD);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);  // clears any previous custom verb
    }

    void CurlEasy::set_method(const http::model::Request& req) {
        const std::string method = string_utils::to_upper(req.method_);

        if (method == constants::GET) {
            return;
        }

        if (method == constants::POST || method == constants::PUT) {
            setopt(CURLOPT_POST, 1L);
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_.size()));
            setopt(CURLOPT_POSTFIELDS, req.body_.c_str());
            if (method == constants::PUT) {
                setopt(CURLOPT_CUSTOMREQUEST, constants::PUT);
            }
            return;
        }

        if (method == constants::DELETE) {
            setopt(CURLOPT_CUSTOMREQUEST, constants::DELETE);
            return;
        }

        throw std::invalid_argument("Unsupported HTTP method for transport: " + req.method_);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        apply_header_line(self->last_response_headers_, std::string_view(buffer, bytes));
        return bytes;
    }

    void apply_header_line(http::model::Headers& headers, std::string_view line) {
        // A new status line starts a new header block (redirects, 100-continue).
        if (string_utils::ieq_prefix(line.data(), line.size(), "HTTP/")) {
            headers.clear();
            return;
        }

        const auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            headers[string_utils::trim(std::string(line.substr(0, colon)))] = string_utils::trim(std::string(line.substr(colon + 1)));
        }
    }

    http::model::Response CurlEasy::perform(const http::model::Request& req) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string body;
        prepare_for_new_request(body);

        set_url(req.url_);
        set_headers(req.headers_);
        set_method(req);

        perform_throw();
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw() {
        error_buf_[0] = '\0';
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw std::runtime_error(err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.headers_ = std::move(last_response_headers_);
        return r;
    }

}  // namespace http::client

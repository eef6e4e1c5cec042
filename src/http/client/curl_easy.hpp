#ifndef QBO_LINK_CURL_EASY_HPP
#define QBO_LINK_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    enum class HttpStatusCode : long {
        BAD_REQUEST = 400,
        UNAUTHORIZED = 401,
        FORBIDDEN = 403,
        NOT_FOUND = 404,
        TOO_MANY_REQUESTS = 429,
        INTERNAL_SERVER_ERROR = 500,
        SERVICE_UNAVAILABLE = 503,
    };

    // Folds one raw header line into headers. A status line clears what an earlier response
    // (redirect, 100-continue) left behind; lines without a colon are ignored.
    void apply_header_line(http::model::Headers& headers, std::string_view line);

    // libcurl transport. One easy handle per instance; perform() serializes on it so the
    // instance can sit at the end of a connection shared across threads.
    class CurlEasy : public IHttpClient {
       public:
        CurlEasy();

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response perform(const http::model::Request& req) override;

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_url(const std::string& u);
        void set_headers(const http::model::Headers& hs);
        void set_method(const http::model::Request& req);
        void perform_throw();
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        http::model::Headers last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
        std::mutex mutex_;
    };
}  // namespace http::client

#endif

#ifndef QBO_LINK_CLIENT_HPP
#define QBO_LINK_CLIENT_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../http/client/interface.hpp"
#include "../http/connection/connection.hpp"
#include "../http/model/model.hpp"
#include "../json/json_value.hpp"
#include "../log/log.hpp"
#include "config.hpp"
#include "response.hpp"

namespace qbo {
    using HttpClientFactory = std::function<std::unique_ptr<http::client::IHttpClient>()>;

    struct RequestArgs {
        std::optional<std::string> entity_;
        std::optional<json::JsonValue> payload_;
        http::model::Params params_;
    };

    // Entry point for the QuickBooks Online REST API: builds authorized connections,
    // dispatches requests and unwraps responses.
    class Client {
       public:
        // A null factory means libcurl (http::client::CurlEasy); a null logger means no logging.
        explicit Client(ClientConfig config, HttpClientFactory http_client_factory = nullptr, logging::Logger logger = nullptr);

        ~Client() = default;
        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;
        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

        // JSON connection: Accept/Content-Type defaults (caller headers win), then
        // auth -> raise_http_error -> url_encoded -> adapter.
        [[nodiscard]] http::connection::Connection authorized_json_connection(const std::string& url, const http::model::Headers& headers = {}) const;

        // Same chain with multipart encoding in place of url encoding.
        [[nodiscard]] http::connection::Connection authorized_multipart_connection(const std::string& url) const;

        // Base URL, headers and the detailed logger when logging is enabled. configure adds
        // the remaining layers.
        [[nodiscard]] http::connection::Connection build_connection(const std::string& url, const http::model::Headers& headers,
                                                                    const std::function<void(http::connection::ConnectionBuilder&)>& configure = nullptr) const;

        // Default JSON connection to the configured company endpoint, built once.
        const http::connection::Connection& connection();

        NormalizedResult request(std::string_view method, const std::string& path, const RequestArgs& args = {});

        // method is one of GET, POST, PUT, DELETE (any case); anything else throws
        // std::invalid_argument. POST and PUT require a payload.
        [[nodiscard]] http::model::Response raw_request(std::string_view method, const http::connection::Connection& conn, const std::string& path,
                                                        const std::optional<json::JsonValue>& payload = std::nullopt,
                                                        const http::model::Params& params = {}) const;

        [[nodiscard]] NormalizedResult response(const http::model::Response& resp, const std::optional<std::string>& entity = std::nullopt) const;

        // Appends params and the configured minor version as a query string.
        [[nodiscard]] std::string finalize_path(const std::string& path, const http::model::Params& params = {}) const;

        // OAuth1 app connection endpoints.
        NormalizedResult disconnect();
        NormalizedResult reconnect();

        [[nodiscard]] const ClientConfig& config() const { return config_; }

       private:
        void add_authorization_middleware(http::connection::ConnectionBuilder& builder) const;
        void add_exception_middleware(http::connection::ConnectionBuilder& builder) const;
        void add_connection_adapter(http::connection::ConnectionBuilder& builder) const;

        ClientConfig config_;
        HttpClientFactory http_client_factory_;
        logging::Logger logger_;
        ResponseNormalizer normalizer_;

        std::mutex connection_mutex_;
        std::optional<http::connection::Connection> connection_;
    };
}  // namespace qbo

#endif

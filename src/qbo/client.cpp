#include "client.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "../http/client/curl_easy.hpp"
#include "../http/middleware/raise_http_error.hpp"
#include "../http/middleware/request_encoding.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"
#include "auth.hpp"

namespace qbo {
    static constexpr const char* MINOR_VERSION_PARAM = "minorversion";

    Client::Client(ClientConfig config, HttpClientFactory http_client_factory, logging::Logger logger)
        : config_(std::move(config)),
          http_client_factory_(std::move(http_client_factory)),
          logger_(logging::or_null(std::move(logger))),
          normalizer_(logger_, config_.parse_mode_) {
        if (!http_client_factory_) {
            http_client_factory_ = []() { return std::make_unique<http::client::CurlEasy>(); };
        }
    }

    //
    // Connection construction
    //

    http::connection::Connection Client::build_connection(const std::string& url, const http::model::Headers& headers,
                                                          const std::function<void(http::connection::ConnectionBuilder&)>& configure) const {
        http::connection::ConnectionBuilder builder(url);
        if (config_.log_) {
            builder.with_logger(logger_, constants::LOG_TAG);
        }
        builder.with_headers(headers);
        if (configure) {
            configure(builder);
        }
        return builder.build();
    }

    http::connection::Connection Client::authorized_json_connection(const std::string& url, const http::model::Headers& headers) const {
        http::model::Headers merged = headers;
        merged.emplace(constants::ACCEPT, constants::JSON_ACCEPT);                  // only accept JSON
        merged.emplace(constants::CONTENT_TYPE, constants::JSON_CONTENT_TYPE);  // required when the request has a body

        return build_connection(url, merged, [this](http::connection::ConnectionBuilder& builder) {
            add_authorization_middleware(builder);
            add_exception_middleware(builder);
            builder.use(std::make_shared<http::middleware::UrlEncodedRequest>());
            add_connection_adapter(builder);
        });
    }

    http::connection::Connection Client::authorized_multipart_connection(const std::string& url) const {
        const http::model::Headers headers = {{constants::CONTENT_TYPE, constants::MULTIPART_CONTENT_TYPE}};

        return build_connection(url, headers, [this](http::connection::ConnectionBuilder& builder) {
            add_authorization_middleware(builder);
            add_exception_middleware(builder);
            builder.use(std::make_shared<http::middleware::MultipartRequest>());
            add_connection_adapter(builder);
        });
    }

    void Client::add_authorization_middleware(http::connection::ConnectionBuilder& builder) const {
        builder.use(make_auth_middleware(select_auth(config_.credentials_)));
    }

    void Client::add_exception_middleware(http::connection::ConnectionBuilder& builder) const {
        builder.use(std::make_shared<http::middleware::RaiseHttpError>());
    }

    void Client::add_connection_adapter(http::connection::ConnectionBuilder& builder) const {
        std::shared_ptr<http::client::IHttpClient> adapter = http_client_factory_();
        builder.with_adapter(std::move(adapter));
    }

    const http::connection::Connection& Client::connection() {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        if (!connection_) {
            connection_.emplace(authorized_json_connection(config_.endpoint_url()));
        }
        return *connection_;
    }

    //
    // Request dispatch
    //

    NormalizedResult Client::request(std::string_view method, const std::string& path, const RequestArgs& args) {
        const http::model::Response raw_response = raw_request(method, connection(), path, args.payload_, args.params_);
        return response(raw_response, args.entity_);
    }

    http::model::Response Client::raw_request(std::string_view method, const http::connection::Connection& conn, const std::string& path,
                                              const std::optional<json::JsonValue>& payload, const http::model::Params& params) const {
        const std::string verb = string_utils::to_upper(std::string(method));

        if (verb == constants::GET || verb == constants::DELETE) {
            return conn.run(conn.new_request(verb, finalize_path(path, params)));
        }

        if (verb == constants::POST || verb == constants::PUT) {
            if (!payload) {
                throw std::invalid_argument(verb + " request to '" + path + "' requires a payload");
            }
            http::model::Request req = conn.new_request(verb, finalize_path(path, params));
            req.body_ = payload->dump();
            return conn.run(std::move(req));
        }

        throw std::invalid_argument("Unhandled request method '" + std::string(method) + "'");
    }

    NormalizedResult Client::response(const http::model::Response& resp, const std::optional<std::string>& entity) const {
        return normalizer_.normalize(resp, entity);
    }

    std::string Client::finalize_path(const std::string& path, const http::model::Params& params) const {
        http::model::Params query = params;
        if (config_.minor_version_) {
            query.emplace_back(MINOR_VERSION_PARAM, std::to_string(*config_.minor_version_));
        }
        if (query.empty()) {
            return path;
        }
        return path + (path.find('?') == std::string::npos ? "?" : "&") + string_utils::build_query(query);
    }

    //
    // OAuth1 app connection endpoints
    //

    NormalizedResult Client::disconnect() {
        const std::string path = std::string(Endpoints::APP_CONNECTION_URL) + "/disconnect";
        return request(constants::GET, path);
    }

    NormalizedResult Client::reconnect() {
        const std::string path = std::string(Endpoints::APP_CONNECTION_URL) + "/reconnect";
        return request(constants::GET, path);
    }
}  // namespace qbo

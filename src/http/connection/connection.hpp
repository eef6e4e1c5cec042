#ifndef QBO_LINK_CONNECTION_HPP
#define QBO_LINK_CONNECTION_HPP

#include <memory>
#include <string>
#include <vector>

#include "../../log/log.hpp"
#include "../client/interface.hpp"
#include "../middleware/interface.hpp"
#include "../model/model.hpp"

namespace http::connection {

    // A base URL, default headers and a fixed middleware chain ending in a transport adapter.
    // Immutable after ConnectionBuilder::build(); copies share the same chain and adapter.
    class Connection {
       public:
        [[nodiscard]] const std::string& url() const { return base_url_; }
        [[nodiscard]] const http::model::Headers& headers() const { return headers_; }
        [[nodiscard]] std::vector<std::string> middleware_names() const;

        // Joins path onto the base URL. Absolute http(s) URLs are returned unchanged.
        [[nodiscard]] std::string resolve(const std::string& path) const;

        // Builds a request for path with the connection's default headers applied.
        [[nodiscard]] http::model::Request new_request(const std::string& method, const std::string& path) const;

        http::model::Response get(const std::string& path) const;
        http::model::Response del(const std::string& path) const;
        http::model::Response post(const std::string& path, std::string body) const;

        // Runs req through every middleware and the adapter.
        http::model::Response run(http::model::Request req) const;

       private:
        friend class ConnectionBuilder;

        Connection() = default;

        http::model::Response dispatch(std::size_t index, http::model::Request& req) const;

        std::string base_url_;
        http::model::Headers headers_;
        std::vector<std::shared_ptr<const http::middleware::IMiddleware>> middleware_;
        std::shared_ptr<http::client::IHttpClient> adapter_;
    };

    class ConnectionBuilder {
       public:
        explicit ConnectionBuilder(std::string url);

        // Entries replace existing ones with the same (case-insensitive) name.
        ConnectionBuilder& with_headers(const http::model::Headers& headers);
        // Entries are only added where no header of that name exists yet.
        ConnectionBuilder& with_default_headers(const http::model::Headers& headers);
        // Attaches the detailed request/response logger as the outermost layer.
        ConnectionBuilder& with_logger(logging::Logger logger, std::string tag);
        ConnectionBuilder& use(std::shared_ptr<const http::middleware::IMiddleware> middleware);
        ConnectionBuilder& with_adapter(std::shared_ptr<http::client::IHttpClient> adapter);
        // Throws std::runtime_error when no transport adapter is set. build() runs it.
        void validate() const;
        [[nodiscard]] Connection build() const;

       private:
        Connection connection_;
        std::shared_ptr<const http::middleware::IMiddleware> logger_;
    };

}  // namespace http::connection

#endif

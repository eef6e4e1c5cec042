#include "connection.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../middleware/detailed_logger.hpp"

namespace http::connection {

    //
    // ConnectionBuilder implementation
    //

    ConnectionBuilder::ConnectionBuilder(std::string url) { connection_.base_url_ = std::move(url); }

    ConnectionBuilder& ConnectionBuilder::with_headers(const http::model::Headers& headers) {
        for (const auto& [name, value] : headers) {
            connection_.headers_.erase(name);
            connection_.headers_.emplace(name, value);
        }
        return *this;
    }

    ConnectionBuilder& ConnectionBuilder::with_default_headers(const http::model::Headers& headers) {
        for (const auto& [name, value] : headers) {
            connection_.headers_.emplace(name, value);
        }
        return *this;
    }

    ConnectionBuilder& ConnectionBuilder::with_logger(logging::Logger logger, std::string tag) {
        logger_ = std::make_shared<http::middleware::DetailedLogger>(std::move(logger), std::move(tag));
        return *this;
    }

    ConnectionBuilder& ConnectionBuilder::use(std::shared_ptr<const http::middleware::IMiddleware> middleware) {
        if (middleware == nullptr) {
            throw std::invalid_argument("Middleware must not be null");
        }
        connection_.middleware_.push_back(std::move(middleware));
        return *this;
    }

    ConnectionBuilder& ConnectionBuilder::with_adapter(std::shared_ptr<http::client::IHttpClient> adapter) {
        connection_.adapter_ = std::move(adapter);
        return *this;
    }

    void ConnectionBuilder::validate() const {
        if (connection_.adapter_ == nullptr) {
            throw std::runtime_error("Transport adapter is required");
        }
    }

    Connection ConnectionBuilder::build() const {
        validate();

        Connection built = connection_;
        if (logger_ != nullptr) {
            built.middleware_.insert(built.middleware_.begin(), logger_);
        }
        return built;
    }

    //
    // Connection implementation
    //

    std::vector<std::string> Connection::middleware_names() const {
        std::vector<std::string> names;
        names.reserve(middleware_.size() + 1);
        for (const auto& m : middleware_) {
            names.emplace_back(m->name());
        }
        names.emplace_back("adapter");
        return names;
    }

    std::string Connection::resolve(const std::string& path) const {
        if (string_utils::starts_with(path, "http://") || string_utils::starts_with(path, "https://")) {
            return path;
        }
        if (path.empty()) {
            return base_url_;
        }

        std::string url = base_url_;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url + (path.front() == '/' ? "" : "/") + path;
    }

    http::model::Request Connection::new_request(const std::string& method, const std::string& path) const {
        http::model::Request req;
        req.method_ = string_utils::to_upper(method);
        req.url_ = resolve(path);
        req.headers_ = headers_;
        return req;
    }

    http::model::Response Connection::get(const std::string& path) const { return run(new_request(constants::GET, path)); }

    http::model::Response Connection::del(const std::string& path) const { return run(new_request(constants::DELETE, path)); }

    http::model::Response Connection::post(const std::string& path, std::string body) const {
        http::model::Request req = new_request(constants::POST, path);
        req.body_ = std::move(body);
        return run(std::move(req));
    }

    http::model::Response Connection::run(http::model::Request req) const { return dispatch(0, req); }

    http::model::Response Connection::dispatch(std::size_t index, http::model::Request& req) const {
        if (index == middleware_.size()) {
            return adapter_->perform(req);
        }
        return middleware_[index]->call(req, [this, index](http::model::Request& r) { return dispatch(index + 1, r); });
    }

}  // namespace http::connection

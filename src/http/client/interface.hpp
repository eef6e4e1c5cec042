#ifndef QBO_LINK_CLIENT_INTERFACE_HPP
#define QBO_LINK_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    // Final link of a connection's middleware chain: puts the request on the wire.
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response perform(const http::model::Request& req) = 0;
    };
}  // namespace http::client

#endif

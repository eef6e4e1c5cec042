#ifndef QBO_LINK_MIDDLEWARE_INTERFACE_HPP
#define QBO_LINK_MIDDLEWARE_INTERFACE_HPP

#include <functional>
#include <string_view>

#include "../model/model.hpp"

namespace http::middleware {
    // Invokes the rest of the chain (inner middleware, then the transport).
    using Next = std::function<http::model::Response(http::model::Request&)>;

    // One layer of a connection's request/response pipeline. Layers are shared between copies
    // of a connection and must not hold per-request state.
    class IMiddleware {
       public:
        IMiddleware() = default;
        virtual ~IMiddleware() = default;
        IMiddleware(const IMiddleware&) = delete;
        IMiddleware& operator=(const IMiddleware&) = delete;
        IMiddleware(IMiddleware&&) = delete;
        IMiddleware& operator=(IMiddleware&&) = delete;

        [[nodiscard]] virtual std::string_view name() const = 0;
        virtual http::model::Response call(http::model::Request& req, const Next& next) const = 0;
    };
}  // namespace http::middleware

#endif

#ifndef QBO_LINK_AUTH_HPP
#define QBO_LINK_AUTH_HPP

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "../http/middleware/interface.hpp"
#include "../http/middleware/oauth1.hpp"

namespace qbo {
    // Supplied by the caller, never modified here. Either the four OAuth1 fields or the OAuth2
    // access token are expected to be set.
    struct Credentials {
        std::optional<std::string> consumer_key_;
        std::optional<std::string> consumer_secret_;
        std::optional<std::string> token_;
        std::optional<std::string> token_secret_;
        std::optional<std::string> access_token_;
    };

    enum class AuthState {
        UNCONFIGURED,
        OAUTH1_SELECTED,
        OAUTH2_SELECTED,
    };

    struct OAuth1Selected {
        http::middleware::OAuth1Options options_;
    };

    struct OAuth2Selected {
        std::string access_token_;
    };

    using AuthChoice = std::variant<OAuth1Selected, OAuth2Selected>;

    // Token wins over access token; neither set is UNCONFIGURED.
    [[nodiscard]] AuthState auth_state(const Credentials& credentials) noexcept;

    // Throws ConfigurationError when no scheme is configured or the OAuth1 set is incomplete.
    [[nodiscard]] AuthChoice select_auth(const Credentials& credentials);

    [[nodiscard]] std::shared_ptr<const http::middleware::IMiddleware> make_auth_middleware(const AuthChoice& choice);
}  // namespace qbo

#endif

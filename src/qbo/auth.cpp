#include "auth.hpp"

#include <memory>
#include <string>
#include <variant>

#include "../http/middleware/bearer_token.hpp"
#include "../http/middleware/oauth1.hpp"
#include "errors.hpp"

namespace qbo {
    namespace {
        bool present(const std::optional<std::string>& field) { return field.has_value() && !field->empty(); }

        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;
    }  // namespace

    AuthState auth_state(const Credentials& credentials) noexcept {
        if (present(credentials.token_)) {
            return AuthState::OAUTH1_SELECTED;
        }
        if (present(credentials.access_token_)) {
            return AuthState::OAUTH2_SELECTED;
        }
        return AuthState::UNCONFIGURED;
    }

    AuthChoice select_auth(const Credentials& credentials) {
        switch (auth_state(credentials)) {
            case AuthState::OAUTH1_SELECTED:
                if (!present(credentials.consumer_key_) || !present(credentials.consumer_secret_) || !present(credentials.token_secret_)) {
                    throw ConfigurationError("OAuth1 requires consumer_key, consumer_secret, token and token_secret together");
                }
                return OAuth1Selected{http::middleware::OAuth1Options{
                    .consumer_key_ = *credentials.consumer_key_,
                    .consumer_secret_ = *credentials.consumer_secret_,
                    .token_ = *credentials.token_,
                    .token_secret_ = *credentials.token_secret_,
                }};
            case AuthState::OAUTH2_SELECTED:
                return OAuth2Selected{*credentials.access_token_};
            case AuthState::UNCONFIGURED:
                break;
        }
        throw ConfigurationError("Must set either the token or access_token");
    }

    std::shared_ptr<const http::middleware::IMiddleware> make_auth_middleware(const AuthChoice& choice) {
        return std::visit(overloaded{
                              [](const OAuth1Selected& c) -> std::shared_ptr<const http::middleware::IMiddleware> {
                                  return std::make_shared<http::middleware::OAuth1Signer>(c.options_);
                              },
                              [](const OAuth2Selected& c) -> std::shared_ptr<const http::middleware::IMiddleware> {
                                  return std::make_shared<http::middleware::BearerToken>(c.access_token_);
                              },
                          },
                          choice);
    }
}  // namespace qbo

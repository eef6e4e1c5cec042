#ifndef QBO_LINK_OAUTH1_HPP
#define QBO_LINK_OAUTH1_HPP

#include <functional>
#include <string>
#include <string_view>

#include "../../utils/string_utils.hpp"
#include "interface.hpp"

namespace http::middleware {
    struct OAuth1Options {
        std::string consumer_key_;
        std::string consumer_secret_;
        std::string token_;
        std::string token_secret_;
    };

    // RFC 5849 building blocks, HMAC-SHA1 only.
    namespace oauth1 {
        inline constexpr const char* SIGNATURE_METHOD = "HMAC-SHA1";
        inline constexpr const char* VERSION = "1.0";

        // scheme://host[:port]/path with scheme and host lowercased, default ports, query and
        // fragment removed.
        std::string normalized_url(std::string_view url);

        std::string signature_base_string(std::string_view method, std::string_view url, string_utils::KeyValues params);

        // base64(HMAC-SHA1(enc(consumer_secret) & enc(token_secret), base))
        std::string hmac_sha1_signature(std::string_view base, std::string_view consumer_secret, std::string_view token_secret);

        std::string generate_nonce();
        std::string timestamp_now();
    }  // namespace oauth1

    // Signs each request with an "Authorization: OAuth ..." header. Query parameters and, for
    // form-encoded bodies, body parameters take part in the signature.
    class OAuth1Signer : public IMiddleware {
       public:
        using NonceSource = std::function<std::string()>;
        using ClockSource = std::function<std::string()>;

        explicit OAuth1Signer(OAuth1Options options, NonceSource nonce = oauth1::generate_nonce, ClockSource clock = oauth1::timestamp_now);

        [[nodiscard]] std::string_view name() const override { return "oauth1"; }
        http::model::Response call(http::model::Request& req, const Next& next) const override;

        [[nodiscard]] std::string authorization_header(const http::model::Request& req) const;

       private:
        OAuth1Options options_;
        NonceSource nonce_;
        ClockSource clock_;
    };
}  // namespace http::middleware

#endif

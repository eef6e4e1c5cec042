#ifndef QBO_LINK_CONFIG_HPP
#define QBO_LINK_CONFIG_HPP

#include <optional>
#include <string>

#include "auth.hpp"

namespace qbo {
    struct Endpoints {
        static constexpr const char* V3_SANDBOX = "https://sandbox-quickbooks.api.intuit.com/v3/company/";
        static constexpr const char* V3_PRODUCTION = "https://quickbooks.api.intuit.com/v3/company/";
        static constexpr const char* APP_CONNECTION_URL = "https://appcenter.intuit.com/api/v1/connection";
    };

    enum class Environment {
        SANDBOX,
        PRODUCTION,
    };

    // What the normalizer does when a body cannot be parsed or unwrapped.
    enum class ParseMode {
        BEST_EFFORT,  // log, return what is available, flag the result degraded
        STRICT,       // throw http::http_error::ResponseParseError
    };

    struct EnvKeys {
        static constexpr const char* CONSUMER_KEY = "QBO_CONSUMER_KEY";
        static constexpr const char* CONSUMER_SECRET = "QBO_CONSUMER_SECRET";
        static constexpr const char* TOKEN = "QBO_TOKEN";
        static constexpr const char* TOKEN_SECRET = "QBO_TOKEN_SECRET";
        static constexpr const char* ACCESS_TOKEN = "QBO_ACCESS_TOKEN";
        static constexpr const char* REALM_ID = "QBO_REALM_ID";
        static constexpr const char* ENVIRONMENT = "QBO_ENVIRONMENT";
        static constexpr const char* MINOR_VERSION = "QBO_MINOR_VERSION";
        static constexpr const char* LOG = "QBO_LOG";
        static constexpr const char* STRICT = "QBO_STRICT";
    };

    struct ClientConfig {
        Credentials credentials_;
        std::string realm_id_;
        Environment environment_ = Environment::SANDBOX;
        std::optional<int> minor_version_;
        bool log_ = false;
        ParseMode parse_mode_ = ParseMode::BEST_EFFORT;

        // V3 base for the environment followed by the realm id.
        [[nodiscard]] std::string endpoint_url() const;

        // Reads the QBO_* variables listed in EnvKeys. Throws ConfigurationError on malformed values.
        static ClientConfig from_env();
    };

    Environment parse_environment(const std::string& value);
    bool parse_flag(const std::string& value);
}  // namespace qbo

#endif

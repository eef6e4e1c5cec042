#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"
#include "errors.hpp"

namespace qbo {
    namespace {
        std::optional<std::string> env(const char* key) {
            const char* value = std::getenv(key);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string(value);
        }
    }  // namespace

    std::string ClientConfig::endpoint_url() const {
        const std::string base = environment_ == Environment::PRODUCTION ? Endpoints::V3_PRODUCTION : Endpoints::V3_SANDBOX;
        return base + realm_id_;
    }

    Environment parse_environment(const std::string& value) {
        const std::string v = string_utils::to_lower(string_utils::trim(value));
        if (v == "sandbox") {
            return Environment::SANDBOX;
        }
        if (v == "production") {
            return Environment::PRODUCTION;
        }
        throw ConfigurationError("Invalid environment '" + value + "', expected sandbox or production");
    }

    bool parse_flag(const std::string& value) {
        const std::string v = string_utils::to_lower(string_utils::trim(value));
        return v == "1" || v == "true" || v == "yes";
    }

    ClientConfig ClientConfig::from_env() {
        ClientConfig cfg;
        cfg.credentials_ = Credentials{
            .consumer_key_ = env(EnvKeys::CONSUMER_KEY),
            .consumer_secret_ = env(EnvKeys::CONSUMER_SECRET),
            .token_ = env(EnvKeys::TOKEN),
            .token_secret_ = env(EnvKeys::TOKEN_SECRET),
            .access_token_ = env(EnvKeys::ACCESS_TOKEN),
        };
        cfg.realm_id_ = env(EnvKeys::REALM_ID).value_or("");

        if (auto environment = env(EnvKeys::ENVIRONMENT)) {
            cfg.environment_ = parse_environment(*environment);
        }

        if (auto minor = env(EnvKeys::MINOR_VERSION)) {
            char* end = nullptr;
            errno = 0;
            const long v = std::strtol(minor->c_str(), &end, constants::BASE_10);
            if (*end != '\0' || errno == ERANGE || v <= 0 || v > std::numeric_limits<int>::max()) {
                throw ConfigurationError("Invalid " + std::string(EnvKeys::MINOR_VERSION) + " '" + *minor + "'");
            }
            cfg.minor_version_ = static_cast<int>(v);
        }

        if (auto log = env(EnvKeys::LOG)) {
            cfg.log_ = parse_flag(*log);
        }
        if (auto strict = env(EnvKeys::STRICT)) {
            cfg.parse_mode_ = parse_flag(*strict) ? ParseMode::STRICT : ParseMode::BEST_EFFORT;
        }

        return cfg;
    }
}  // namespace qbo

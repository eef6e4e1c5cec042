#include "oauth1.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::middleware {
    namespace oauth1 {
        namespace {
            constexpr size_t NONCE_BYTES = 16;
            constexpr size_t SHA1_DIGEST_BYTES = 20;
            constexpr const char* HTTP_DEFAULT_PORT = ":80";
            constexpr const char* HTTPS_DEFAULT_PORT = ":443";

            std::string base64(const unsigned char* data, size_t len) {
                std::string out(4 * ((len + 2) / 3), '\0');
                const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
                out.resize(static_cast<size_t>(written));
                return out;
            }
        }  // namespace

        std::string normalized_url(std::string_view url) {
            const auto scheme_end = url.find("://");
            if (scheme_end == std::string_view::npos) {
                throw std::invalid_argument("OAuth1 signing requires an absolute URL: " + std::string(url));
            }

            const std::string scheme = string_utils::to_lower(std::string(url.substr(0, scheme_end)));
            std::string_view rest = url.substr(scheme_end + 3);

            rest = rest.substr(0, rest.find_first_of("?#"));

            const auto path_start = rest.find('/');
            std::string authority = string_utils::to_lower(std::string(rest.substr(0, path_start)));
            const std::string path = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));

            if ((scheme == "http" && string_utils::ends_with(authority, HTTP_DEFAULT_PORT)) ||
                (scheme == "https" && string_utils::ends_with(authority, HTTPS_DEFAULT_PORT))) {
                authority.erase(authority.rfind(':'));
            }

            return scheme + "://" + authority + path;
        }

        std::string signature_base_string(std::string_view method, std::string_view url, string_utils::KeyValues params) {
            std::vector<std::pair<std::string, std::string>> encoded;
            encoded.reserve(params.size());
            for (const auto& [key, value] : params) {
                encoded.emplace_back(string_utils::url_encode(key), string_utils::url_encode(value));
            }
            std::sort(encoded.begin(), encoded.end());

            std::string normalized_params;
            for (const auto& [key, value] : encoded) {
                if (!normalized_params.empty()) {
                    normalized_params.push_back('&');
                }
                normalized_params += key + "=" + value;
            }

            return string_utils::to_upper(std::string(method)) + "&" + string_utils::url_encode(normalized_url(url)) + "&" +
                   string_utils::url_encode(normalized_params);
        }

        std::string hmac_sha1_signature(std::string_view base, std::string_view consumer_secret, std::string_view token_secret) {
            const std::string key = string_utils::url_encode(consumer_secret) + "&" + string_utils::url_encode(token_secret);

            std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
            unsigned int mac_len = 0;
            const unsigned char* p = HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(base.data()),
                                          base.size(), mac.data(), &mac_len);
            if (p == nullptr || mac_len != SHA1_DIGEST_BYTES) {
                throw std::runtime_error("HMAC-SHA1 computation failed");
            }

            return base64(mac.data(), mac_len);
        }

        std::string generate_nonce() {
            std::array<unsigned char, NONCE_BYTES> bytes{};
            if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
                throw std::runtime_error("RAND_bytes failed while generating OAuth nonce");
            }

            static constexpr const char* HEX = "0123456789abcdef";
            std::string out;
            out.reserve(bytes.size() * 2);
            for (const unsigned char b : bytes) {
                out.push_back(HEX[b >> 4U]);
                out.push_back(HEX[b & 0x0FU]);
            }
            return out;
        }

        std::string timestamp_now() {
            const auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
            return std::to_string(now);
        }
    }  // namespace oauth1

    OAuth1Signer::OAuth1Signer(OAuth1Options options, NonceSource nonce, ClockSource clock)
        : options_(std::move(options)), nonce_(std::move(nonce)), clock_(std::move(clock)) {}

    std::string OAuth1Signer::authorization_header(const http::model::Request& req) const {
        string_utils::KeyValues oauth_params = {
            {"oauth_consumer_key", options_.consumer_key_},
            {"oauth_nonce", nonce_()},
            {"oauth_signature_method", oauth1::SIGNATURE_METHOD},
            {"oauth_timestamp", clock_()},
            {"oauth_token", options_.token_},
            {"oauth_version", oauth1::VERSION},
        };

        string_utils::KeyValues signed_params = oauth_params;

        const auto query_start = req.url_.find('?');
        if (query_start != std::string::npos) {
            const std::string query = req.url_.substr(query_start + 1, req.url_.find('#') - query_start - 1);
            for (auto& kv : string_utils::parse_query(query)) {
                signed_params.push_back(std::move(kv));
            }
        }

        // Form fields are signed whether or not the encoding layer has serialized them yet.
        auto content_type = http::model::find_header(req.headers_, constants::CONTENT_TYPE);
        const bool form_encoded = content_type && string_utils::ieq_prefix(content_type->c_str(), content_type->size(), constants::FORM_CONTENT_TYPE);
        if (form_encoded && !req.body_.empty()) {
            for (auto& kv : string_utils::parse_query(req.body_)) {
                signed_params.push_back(std::move(kv));
            }
        } else if ((form_encoded || !content_type) && req.body_.empty()) {
            signed_params.insert(signed_params.end(), req.form_.begin(), req.form_.end());
        }

        const std::string base = oauth1::signature_base_string(req.method_, req.url_, std::move(signed_params));
        oauth_params.emplace_back("oauth_signature", oauth1::hmac_sha1_signature(base, options_.consumer_secret_, options_.token_secret_));
        std::sort(oauth_params.begin(), oauth_params.end());

        std::string header = "OAuth ";
        for (size_t i = 0; i < oauth_params.size(); ++i) {
            if (i > 0) {
                header += ", ";
            }
            header += oauth_params[i].first + "=\"" + string_utils::url_encode(oauth_params[i].second) + "\"";
        }
        return header;
    }

    http::model::Response OAuth1Signer::call(http::model::Request& req, const Next& next) const {
        req.headers_[constants::AUTHORIZATION] = authorization_header(req);
        return next(req);
    }
}  // namespace http::middleware

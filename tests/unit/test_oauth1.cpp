#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include "http/connection/connection.hpp"
#include "http/middleware/bearer_token.hpp"
#include "http/middleware/oauth1.hpp"
#include "support/fake_http_client.hpp"

using namespace http::middleware;
using namespace qbo::testing;

namespace {
    // Example request from the OAuth 1.0 protocol guide.
    OAuth1Options photos_options() {
        return OAuth1Options{
            .consumer_key_ = "dpf43f3p2l4k3l03",
            .consumer_secret_ = "kd94hf93k423kf44",
            .token_ = "nnch734d00sl2jdk",
            .token_secret_ = "pfkkdhi9sl3r4s00",
        };
    }

    const char* const PHOTOS_URL = "http://photos.example.net/photos?file=vacation.jpg&size=original";
    const char* const PHOTOS_BASE_STRING =
        "GET&http%3A%2F%2Fphotos.example.net%2Fphotos&file%3Dvacation.jpg%26oauth_consumer_key%3Ddpf43f3p2l4k3l03"
        "%26oauth_nonce%3Dkllo9940pd9333jh%26oauth_signature_method%3DHMAC-SHA1%26oauth_timestamp%3D1191242096"
        "%26oauth_token%3Dnnch734d00sl2jdk%26oauth_version%3D1.0%26size%3Doriginal";
}  // namespace

TEST_CASE("normalized_url strips query, fragment and default ports", "[oauth1]") {
    REQUIRE(oauth1::normalized_url("HTTP://Photos.Example.NET:80/photos?size=original") == "http://photos.example.net/photos");
    REQUIRE(oauth1::normalized_url("https://example.com:443/a/b#frag") == "https://example.com/a/b");
    REQUIRE(oauth1::normalized_url("https://example.com:8443/a") == "https://example.com:8443/a");
    REQUIRE(oauth1::normalized_url("https://example.com") == "https://example.com/");
    REQUIRE_THROWS_AS(oauth1::normalized_url("/relative/path"), std::invalid_argument);
}

TEST_CASE("signature base string sorts and encodes parameters", "[oauth1]") {
    const std::string base = oauth1::signature_base_string("get", PHOTOS_URL,
                                                           {
                                                               {"size", "original"},
                                                               {"file", "vacation.jpg"},
                                                               {"oauth_consumer_key", "dpf43f3p2l4k3l03"},
                                                               {"oauth_token", "nnch734d00sl2jdk"},
                                                               {"oauth_signature_method", "HMAC-SHA1"},
                                                               {"oauth_timestamp", "1191242096"},
                                                               {"oauth_nonce", "kllo9940pd9333jh"},
                                                               {"oauth_version", "1.0"},
                                                           });

    REQUIRE(base == PHOTOS_BASE_STRING);
}

TEST_CASE("HMAC-SHA1 signature matches the reference value", "[oauth1]") {
    REQUIRE(oauth1::hmac_sha1_signature(PHOTOS_BASE_STRING, "kd94hf93k423kf44", "pfkkdhi9sl3r4s00") == "tR3+Ty81lMeYAr/Fid0kMTYa/WM=");
}

TEST_CASE("generated nonces are random hex", "[oauth1]") {
    const std::string a = oauth1::generate_nonce();
    const std::string b = oauth1::generate_nonce();

    REQUIRE(a.size() == 32);
    REQUIRE(a != b);
    REQUIRE(a.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("OAuth1Signer sets a signed Authorization header", "[oauth1]") {
    auto exchange = std::make_shared<Exchange>();
    auto signer = std::make_shared<OAuth1Signer>(
        photos_options(), [] { return std::string("kllo9940pd9333jh"); }, [] { return std::string("1191242096"); });

    auto conn = http::connection::ConnectionBuilder("http://photos.example.net").use(signer).with_adapter(std::make_shared<FakeHttpClient>(exchange)).build();
    conn.get("photos?file=vacation.jpg&size=original");

    const auto& headers = exchange->last_request().headers_;
    REQUIRE(headers.at("authorization") ==
            "OAuth oauth_consumer_key=\"dpf43f3p2l4k3l03\", oauth_nonce=\"kllo9940pd9333jh\", "
            "oauth_signature=\"tR3%2BTy81lMeYAr%2FFid0kMTYa%2FWM%3D\", oauth_signature_method=\"HMAC-SHA1\", "
            "oauth_timestamp=\"1191242096\", oauth_token=\"nnch734d00sl2jdk\", oauth_version=\"1.0\"");
}

TEST_CASE("OAuth1Signer signs form fields that are not encoded yet", "[oauth1]") {
    OAuth1Signer signer(
        photos_options(), [] { return std::string("n"); }, [] { return std::string("1"); });

    http::model::Request plain;
    plain.method_ = "POST";
    plain.url_ = "https://example.com/form";

    http::model::Request with_form = plain;
    with_form.form_ = {{"a", "1"}};

    REQUIRE(signer.authorization_header(plain) != signer.authorization_header(with_form));

    http::model::Request json_body = with_form;
    json_body.headers_["Content-Type"] = "application/json";
    REQUIRE(signer.authorization_header(json_body) == signer.authorization_header(plain));
}

TEST_CASE("BearerToken sets the OAuth2 Authorization header", "[oauth2]") {
    auto exchange = std::make_shared<Exchange>();
    auto conn = http::connection::ConnectionBuilder("https://example.com")
                    .use(std::make_shared<BearerToken>("token-xyz"))
                    .with_adapter(std::make_shared<FakeHttpClient>(exchange))
                    .build();

    conn.get("/v3/company/1");

    REQUIRE(exchange->last_request().headers_.at("Authorization") == "Bearer token-xyz");
}

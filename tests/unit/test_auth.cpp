#include <catch2/catch.hpp>

#include <variant>

#include "qbo/auth.hpp"
#include "qbo/client.hpp"
#include "qbo/errors.hpp"
#include "support/fake_http_client.hpp"

using namespace qbo;
using namespace qbo::testing;

TEST_CASE("auth_state follows which credential fields are set", "[auth]") {
    REQUIRE(auth_state(Credentials{}) == AuthState::UNCONFIGURED);
    REQUIRE(auth_state(oauth1_credentials()) == AuthState::OAUTH1_SELECTED);
    REQUIRE(auth_state(oauth2_credentials()) == AuthState::OAUTH2_SELECTED);

    Credentials empty_strings;
    empty_strings.token_ = "";
    empty_strings.access_token_ = "";
    REQUIRE(auth_state(empty_strings) == AuthState::UNCONFIGURED);
}

TEST_CASE("select_auth fails closed without credentials", "[auth]") {
    REQUIRE_THROWS_AS(select_auth(Credentials{}), ConfigurationError);
    REQUIRE_THROWS_WITH(select_auth(Credentials{}), "Must set either the token or access_token");
}

TEST_CASE("select_auth rejects an incomplete OAuth1 set", "[auth]") {
    Credentials credentials = oauth1_credentials();
    credentials.token_secret_.reset();

    REQUIRE_THROWS_AS(select_auth(credentials), ConfigurationError);
}

TEST_CASE("select_auth picks OAuth1 with all four fields", "[auth]") {
    const AuthChoice choice = select_auth(oauth1_credentials());

    REQUIRE(std::holds_alternative<OAuth1Selected>(choice));
    const auto& options = std::get<OAuth1Selected>(choice).options_;
    REQUIRE(options.consumer_key_ == "ck");
    REQUIRE(options.consumer_secret_ == "cs");
    REQUIRE(options.token_ == "tk");
    REQUIRE(options.token_secret_ == "ts");
}

TEST_CASE("select_auth picks OAuth2 for an access token", "[auth]") {
    const AuthChoice choice = select_auth(oauth2_credentials("abc"));

    REQUIRE(std::holds_alternative<OAuth2Selected>(choice));
    REQUIRE(std::get<OAuth2Selected>(choice).access_token_ == "abc");
}

TEST_CASE("token takes precedence over access token", "[auth]") {
    Credentials credentials = oauth1_credentials();
    credentials.access_token_ = "abc";

    REQUIRE(std::holds_alternative<OAuth1Selected>(select_auth(credentials)));
}

TEST_CASE("authorized connections cannot be built without credentials", "[auth][connection]") {
    auto exchange = std::make_shared<Exchange>();
    ClientConfig config = config_with(Credentials{});
    config.log_ = true;
    Client client(config, fake_factory(exchange));

    REQUIRE_THROWS_AS(client.authorized_json_connection("https://example.com"), ConfigurationError);
    REQUIRE_THROWS_AS(client.authorized_json_connection("https://example.com", {{"X-Extra", "1"}}), ConfigurationError);
    REQUIRE_THROWS_AS(client.authorized_multipart_connection("https://example.com/upload"), ConfigurationError);
    REQUIRE_THROWS_AS(client.connection(), ConfigurationError);
    REQUIRE_THROWS_AS(client.request("GET", "companyinfo/9130"), ConfigurationError);
    REQUIRE(exchange->requests_.empty());
}

TEST_CASE("only the selected auth middleware is attached", "[auth][connection]") {
    auto exchange = std::make_shared<Exchange>();

    SECTION("OAuth1") {
        Client client(config_with(oauth1_credentials()), fake_factory(exchange));
        const auto names = client.authorized_json_connection("https://example.com").middleware_names();

        REQUIRE(names == std::vector<std::string>{"oauth1", "raise_http_error", "url_encoded", "adapter"});
    }

    SECTION("OAuth2") {
        Client client(config_with(oauth2_credentials()), fake_factory(exchange));
        const auto names = client.authorized_json_connection("https://example.com").middleware_names();

        REQUIRE(names == std::vector<std::string>{"oauth2", "raise_http_error", "url_encoded", "adapter"});
    }

    SECTION("multipart") {
        Client client(config_with(oauth2_credentials()), fake_factory(exchange));
        const auto names = client.authorized_multipart_connection("https://example.com").middleware_names();

        REQUIRE(names == std::vector<std::string>{"oauth2", "raise_http_error", "multipart", "adapter"});
    }
}

TEST_CASE("the detailed logger is outermost when logging is enabled", "[auth][connection]") {
    auto exchange = std::make_shared<Exchange>();
    ClientConfig config = config_with(oauth2_credentials());
    config.log_ = true;
    Client client(config, fake_factory(exchange));

    const auto names = client.authorized_json_connection("https://example.com").middleware_names();

    REQUIRE(names == std::vector<std::string>{"detailed_logger", "oauth2", "raise_http_error", "url_encoded", "adapter"});
}

TEST_CASE("a connection built after a configuration error is not cached", "[auth][connection]") {
    auto exchange = std::make_shared<Exchange>();
    Client client(config_with(Credentials{}), fake_factory(exchange));

    REQUIRE_THROWS_AS(client.connection(), ConfigurationError);
    REQUIRE_THROWS_AS(client.connection(), ConfigurationError);
}

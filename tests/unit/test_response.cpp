#include <catch2/catch.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <string>

#include "http/error/http_error.hpp"
#include "json/json_value.hpp"
#include "qbo/response.hpp"
#include "support/fake_http_client.hpp"

using namespace qbo;
using namespace qbo::testing;

namespace {
    std::shared_ptr<spdlog::logger> capture_logger(std::ostringstream& out) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        auto logger = std::make_shared<spdlog::logger>("response_test", sink);
        logger->set_pattern("%l %v");
        logger->set_level(spdlog::level::debug);
        return logger;
    }
}  // namespace

TEST_CASE("detect_envelope picks the wrapper by key", "[response]") {
    REQUIRE(detect_envelope(json::JsonValue::parse(R"({"QueryResponse": {}})")) == Envelope::QUERY_LIST);
    REQUIRE(detect_envelope(json::JsonValue::parse(R"({"AttachableResponse": []})")) == Envelope::ATTACHABLE_LIST);
    REQUIRE(detect_envelope(json::JsonValue::parse(R"({"Customer": {}, "time": "now"})")) == Envelope::SINGLE_ENTITY);
    REQUIRE(std::string(to_string(Envelope::GENERIC)) == "generic");
}

TEST_CASE("empty QueryResponse is nil", "[response]") {
    ResponseNormalizer normalizer;

    const auto result = normalizer.normalize(json_response(200, R"({"QueryResponse": {}})"), "customers");

    REQUIRE(result.is_nil());
    REQUIRE_FALSE(result.is_degraded());
    REQUIRE(result.envelope() == Envelope::QUERY_LIST);
    REQUIRE(result.to_string() == "null");
}

TEST_CASE("QueryResponse yields the entity list", "[response]") {
    ResponseNormalizer normalizer;
    const auto resp = json_response(200, R"({"QueryResponse": {"Customer": [{"Id":"1"}], "startPosition": 1}, "time": "t"})");

    SECTION("by entity name") {
        const auto result = normalizer.normalize(resp, "Customer");
        REQUIRE(result.is_json());
        REQUIRE(result.json().dump() == R"([{"Id":"1"}])");
    }

    SECTION("by plural label") {
        const auto result = normalizer.normalize(resp, "customers");
        REQUIRE(result.json().dump() == R"([{"Id":"1"}])");
    }
}

TEST_CASE("QueryResponse without the entity key returns the sub-mapping", "[response]") {
    ResponseNormalizer normalizer;

    const auto result = normalizer.normalize(json_response(200, R"({"QueryResponse": {"Other": []}})"), "Customer");

    REQUIRE(result.is_json());
    REQUIRE(result.json().dump() == R"({"Other":[]})");
    REQUIRE_FALSE(result.is_degraded());
}

TEST_CASE("empty AttachableResponse is nil without an error", "[response]") {
    ResponseNormalizer normalizer;

    const auto result = normalizer.normalize(json_response(200, R"({"AttachableResponse": []})"), "attachables");

    REQUIRE(result.is_nil());
    REQUIRE_FALSE(result.is_degraded());
    REQUIRE(result.envelope() == Envelope::ATTACHABLE_LIST);
}

TEST_CASE("AttachableResponse unwraps the first element", "[response]") {
    ResponseNormalizer normalizer;

    SECTION("entity present") {
        const auto result =
            normalizer.normalize(json_response(200, R"({"AttachableResponse": [{"Attachable": {"Id": "7"}}, {"Attachable": {"Id": "8"}}]})"), "attachables");
        REQUIRE(result.json().dump() == R"({"Id":"7"})");
    }

    SECTION("entity missing") {
        const auto result = normalizer.normalize(json_response(200, R"({"AttachableResponse": [{"Fault": {"type": "x"}}]})"), "attachables");
        REQUIRE(result.json().dump() == R"({"Fault":{"type":"x"}})");
    }

    SECTION("null first element") {
        const auto result = normalizer.normalize(json_response(200, R"({"AttachableResponse": [null]})"), "attachables");
        REQUIRE(result.is_nil());
    }
}

TEST_CASE("single entity responses unwrap the entity key", "[response]") {
    ResponseNormalizer normalizer;

    const auto result = normalizer.normalize(json_response(200, R"({"JournalEntry": {"Id": "3"}, "time": "t"})"), "journal_entries");

    REQUIRE(result.envelope() == Envelope::SINGLE_ENTITY);
    REQUIRE(result.json().dump() == R"({"Id":"3"})");
}

TEST_CASE("missing single entity key falls back to the whole body and logs", "[response]") {
    std::ostringstream out;
    ResponseNormalizer normalizer(capture_logger(out));

    const auto result = normalizer.normalize(json_response(200, R"({"Invoice": {"Id": "3"}})"), "Customer");

    REQUIRE(result.envelope() == Envelope::GENERIC);
    REQUIRE(result.json().dump() == R"({"Invoice":{"Id":"3"}})");
    REQUIRE_FALSE(result.is_degraded());
    REQUIRE_THAT(out.str(), Catch::Matchers::Contains("entity name not in response body"));
}

TEST_CASE("no entity returns the full parsed body", "[response]") {
    ResponseNormalizer normalizer;

    const auto result = normalizer.normalize(json_response(200, R"({"QueryResponse": {"Customer": []}})"));

    REQUIRE(result.json().dump() == R"({"QueryResponse":{"Customer":[]}})");
    REQUIRE_FALSE(result.envelope().has_value());
}

TEST_CASE("non JSON content passes through unchanged", "[response]") {
    ResponseNormalizer normalizer;
    const std::string pdf("%PDF-1.4\n\x00\x01binary", 18);

    const auto result = normalizer.normalize(make_response(200, pdf, "application/pdf"), "invoices");

    REQUIRE(result.is_raw());
    REQUIRE(result.raw() == pdf);
    REQUIRE_FALSE(result.is_degraded());
}

TEST_CASE("JSON detection ignores case", "[response]") {
    REQUIRE(ResponseNormalizer::is_json(make_response(200, "{}", "Application/JSON")));
    REQUIRE(ResponseNormalizer::is_json(make_response(200, "{}", "application/vnd.api+json")));
    REQUIRE_FALSE(ResponseNormalizer::is_json(make_response(200, "{}", "text/plain")));
    REQUIRE_FALSE(ResponseNormalizer::is_json(make_response(200, "{}", "")));
}

TEST_CASE("malformed JSON degrades to the raw body", "[response]") {
    std::ostringstream out;
    ResponseNormalizer normalizer(capture_logger(out));

    NormalizedResult result = NormalizedResult::nil();
    REQUIRE_NOTHROW(result = normalizer.normalize(json_response(200, R"({"QueryResponse": )"), "customers"));

    REQUIRE(result.is_degraded());
    REQUIRE(result.is_raw());
    REQUIRE(result.raw() == R"({"QueryResponse": )");
    REQUIRE(result.error().has_value());
    REQUIRE_THAT(out.str(), Catch::Matchers::Contains("response parsing error") && Catch::Matchers::Contains("entity=customers"));
}

TEST_CASE("extraction failure degrades to the parsed body", "[response]") {
    ResponseNormalizer normalizer;

    // A scalar QueryResponse cannot be searched for the entity key.
    const auto result = normalizer.normalize(json_response(200, R"({"QueryResponse": 5})"), "customers");

    REQUIRE(result.is_degraded());
    REQUIRE(result.is_json());
    REQUIRE(result.json().dump() == R"({"QueryResponse":5})");
}

TEST_CASE("strict mode raises instead of degrading", "[response]") {
    ResponseNormalizer normalizer(nullptr, ParseMode::STRICT);

    REQUIRE_THROWS_AS(normalizer.normalize(json_response(200, "not json"), "customers"), http::http_error::ResponseParseError);

    try {
        (void)normalizer.normalize(json_response(200, R"({"QueryResponse": 5})"), "customers");
        FAIL("expected ResponseParseError");
    } catch (const http::http_error::ResponseParseError& e) {
        REQUIRE(e.entity_ == "customers");
        REQUIRE(e.body_preview_ == R"({"QueryResponse": 5})");
    }
}

TEST_CASE("strict mode leaves well formed responses alone", "[response]") {
    ResponseNormalizer normalizer(nullptr, ParseMode::STRICT);

    const auto result = normalizer.normalize(json_response(200, R"({"QueryResponse": {}})"), "customers");

    REQUIRE(result.is_nil());
}

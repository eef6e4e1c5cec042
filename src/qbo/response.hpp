#ifndef QBO_LINK_RESPONSE_HPP
#define QBO_LINK_RESPONSE_HPP

#include <optional>
#include <string>
#include <variant>

#include "../http/model/model.hpp"
#include "../json/json_value.hpp"
#include "../log/log.hpp"
#include "config.hpp"

namespace qbo {
    // How the API wrapped the payload. List queries, attachable uploads and single-entity
    // endpoints each use a different shape.
    enum class Envelope {
        QUERY_LIST,       // {"QueryResponse": {"<Entity>": [...], ...}}
        ATTACHABLE_LIST,  // {"AttachableResponse": [{"<Entity>": {...}}, ...]}
        SINGLE_ENTITY,    // {"<Entity>": {...}, "time": ...}
        GENERIC,          // entity key missing; the whole body is the result
    };

    // Picks QUERY_LIST, ATTACHABLE_LIST or SINGLE_ENTITY from the keys present in body.
    [[nodiscard]] Envelope detect_envelope(const json::JsonValue& body);

    const char* to_string(Envelope envelope);

    class NormalizedResult {
       public:
        using Value = std::variant<std::monostate, json::JsonValue, std::string>;

        static NormalizedResult nil(std::optional<Envelope> envelope = std::nullopt);
        static NormalizedResult of_json(json::JsonValue value, std::optional<Envelope> envelope = std::nullopt);
        static NormalizedResult of_raw(std::string body);
        // Best-effort value returned in place of an exception; error() says what went wrong.
        static NormalizedResult degraded(Value value, std::string error);

        [[nodiscard]] bool is_nil() const { return std::holds_alternative<std::monostate>(value_); }
        [[nodiscard]] bool is_json() const { return std::holds_alternative<json::JsonValue>(value_); }
        [[nodiscard]] bool is_raw() const { return std::holds_alternative<std::string>(value_); }
        [[nodiscard]] bool is_degraded() const { return error_.has_value(); }

        // Throw std::bad_variant_access on the wrong alternative.
        [[nodiscard]] const json::JsonValue& json() const { return std::get<json::JsonValue>(value_); }
        [[nodiscard]] const std::string& raw() const { return std::get<std::string>(value_); }

        [[nodiscard]] const Value& value() const { return value_; }
        [[nodiscard]] const std::optional<std::string>& error() const { return error_; }
        [[nodiscard]] const std::optional<Envelope>& envelope() const { return envelope_; }

        // "null", minified JSON, or the raw body.
        [[nodiscard]] std::string to_string() const;

       private:
        NormalizedResult(Value value, std::optional<Envelope> envelope, std::optional<std::string> error);

        Value value_;
        std::optional<Envelope> envelope_;
        std::optional<std::string> error_;
    };

    // Turns raw responses into caller data.
    //
    // Bodies whose Content-Type mentions json are parsed, anything else (PDFs, binary
    // downloads) is passed through untouched. With an entity label the payload is unwrapped
    // from its envelope, see Envelope.
    //
    // Parse and extraction failures do not propagate in BEST_EFFORT mode: they are logged at
    // debug level and the caller gets the raw body (parse failed) or the parsed body
    // (extraction failed), flagged degraded. Callers of this API must tolerate partial data.
    // STRICT mode throws http::http_error::ResponseParseError instead. HTTP and transport
    // errors are raised before a response ever gets here.
    class ResponseNormalizer {
       public:
        explicit ResponseNormalizer(logging::Logger logger = nullptr, ParseMode mode = ParseMode::BEST_EFFORT);

        [[nodiscard]] NormalizedResult normalize(const http::model::Response& resp, const std::optional<std::string>& entity = std::nullopt) const;

        [[nodiscard]] static bool is_json(const http::model::Response& resp);

       private:
        [[nodiscard]] NormalizedResult extract(const json::JsonValue& data, const std::string& entity) const;

        logging::Logger logger_;
        ParseMode mode_;
    };
}  // namespace qbo

#endif

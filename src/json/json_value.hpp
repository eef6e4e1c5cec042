#ifndef QBO_LINK_JSON_VALUE_HPP
#define QBO_LINK_JSON_VALUE_HPP

#include <simdjson.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace json {

    // Immutable view into a parsed simdjson DOM document. Sub-values share the owning parser,
    // so they stay valid after the value they were taken from goes away.
    class JsonValue {
       public:
        // Throws simdjson::simdjson_error on malformed input.
        static JsonValue parse(std::string_view text);

        [[nodiscard]] simdjson::dom::element_type type() const;
        [[nodiscard]] bool is_object() const;
        [[nodiscard]] bool is_array() const;
        [[nodiscard]] bool is_string() const;
        [[nodiscard]] bool is_null() const;

        // Number of members (object) or elements (array). Throws on scalars.
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] bool empty() const { return size() == 0; }

        // Object member lookup. std::nullopt when the key is absent; throws if not an object.
        [[nodiscard]] std::optional<JsonValue> find(std::string_view key) const;
        [[nodiscard]] bool contains(std::string_view key) const { return find(key).has_value(); }

        // First array element, std::nullopt for an empty array; throws if not an array.
        [[nodiscard]] std::optional<JsonValue> first() const;
        [[nodiscard]] JsonValue at(std::size_t index) const;

        [[nodiscard]] std::string as_string() const;

        // Minified JSON text.
        [[nodiscard]] std::string dump() const;

        bool operator==(const JsonValue& other) const { return dump() == other.dump(); }

       private:
        JsonValue(std::shared_ptr<simdjson::dom::parser> parser, simdjson::dom::element element);

        [[nodiscard]] simdjson::dom::object object() const;
        [[nodiscard]] simdjson::dom::array array() const;

        std::shared_ptr<simdjson::dom::parser> parser_;
        simdjson::dom::element element_;
    };

}  // namespace json

#endif

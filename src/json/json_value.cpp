#include "json_value.hpp"

#include <simdjson.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace json {

    JsonValue::JsonValue(std::shared_ptr<simdjson::dom::parser> parser, simdjson::dom::element element)
        : parser_(std::move(parser)), element_(element) {}

    JsonValue JsonValue::parse(std::string_view text) {
        auto parser = std::make_shared<simdjson::dom::parser>();
        const simdjson::padded_string padded(text);

        simdjson::dom::element root;
        const auto error = parser->parse(padded).get(root);
        if (error != simdjson::SUCCESS) {
            throw simdjson::simdjson_error(error);
        }

        return JsonValue(std::move(parser), root);
    }

    simdjson::dom::element_type JsonValue::type() const { return element_.type(); }

    bool JsonValue::is_object() const { return type() == simdjson::dom::element_type::OBJECT; }

    bool JsonValue::is_array() const { return type() == simdjson::dom::element_type::ARRAY; }

    bool JsonValue::is_string() const { return type() == simdjson::dom::element_type::STRING; }

    bool JsonValue::is_null() const { return type() == simdjson::dom::element_type::NULL_VALUE; }

    simdjson::dom::object JsonValue::object() const {
        simdjson::dom::object obj;
        const auto error = element_.get_object().get(obj);
        if (error != simdjson::SUCCESS) {
            throw simdjson::simdjson_error(error);
        }
        return obj;
    }

    simdjson::dom::array JsonValue::array() const {
        simdjson::dom::array arr;
        const auto error = element_.get_array().get(arr);
        if (error != simdjson::SUCCESS) {
            throw simdjson::simdjson_error(error);
        }
        return arr;
    }

    std::size_t JsonValue::size() const {
        if (is_object()) {
            return object().size();
        }
        return array().size();
    }

    std::optional<JsonValue> JsonValue::find(std::string_view key) const {
        simdjson::dom::element child;
        const auto error = object().at_key(key).get(child);
        if (error == simdjson::NO_SUCH_FIELD) {
            return std::nullopt;
        }
        if (error != simdjson::SUCCESS) {
            throw simdjson::simdjson_error(error);
        }
        return JsonValue(parser_, child);
    }

    std::optional<JsonValue> JsonValue::first() const {
        const simdjson::dom::array arr = array();
        for (simdjson::dom::element child : arr) {
            return JsonValue(parser_, child);
        }
        return std::nullopt;
    }

    JsonValue JsonValue::at(std::size_t index) const {
        simdjson::dom::element child;
        const auto error = array().at(index).get(child);
        if (error != simdjson::SUCCESS) {
            throw simdjson::simdjson_error(error);
        }
        return JsonValue(parser_, child);
    }

    std::string JsonValue::as_string() const {
        std::string_view sv;
        const auto error = element_.get_string().get(sv);
        if (error != simdjson::SUCCESS) {
            throw simdjson::simdjson_error(error);
        }
        return std::string(sv);
    }

    std::string JsonValue::dump() const { return simdjson::minify(element_); }

}  // namespace json

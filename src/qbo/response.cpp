#include "response.hpp"

#include <exception>
#include <optional>
#include <string>

#include "../http/error/http_error.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"
#include "entity.hpp"

namespace qbo {
    static constexpr const char* QUERY_RESPONSE = "QueryResponse";
    static constexpr const char* ATTACHABLE_RESPONSE = "AttachableResponse";

    Envelope detect_envelope(const json::JsonValue& body) {
        if (body.contains(QUERY_RESPONSE)) {
            return Envelope::QUERY_LIST;
        }
        if (body.contains(ATTACHABLE_RESPONSE)) {
            return Envelope::ATTACHABLE_LIST;
        }
        return Envelope::SINGLE_ENTITY;
    }

    const char* to_string(Envelope envelope) {
        switch (envelope) {
            case Envelope::QUERY_LIST:
                return "query_list";
            case Envelope::ATTACHABLE_LIST:
                return "attachable_list";
            case Envelope::SINGLE_ENTITY:
                return "single_entity";
            case Envelope::GENERIC:
                break;
        }
        return "generic";
    }

    //
    // NormalizedResult implementation
    //

    NormalizedResult::NormalizedResult(Value value, std::optional<Envelope> envelope, std::optional<std::string> error)
        : value_(std::move(value)), envelope_(envelope), error_(std::move(error)) {}

    NormalizedResult NormalizedResult::nil(std::optional<Envelope> envelope) { return {std::monostate{}, envelope, std::nullopt}; }

    NormalizedResult NormalizedResult::of_json(json::JsonValue value, std::optional<Envelope> envelope) { return {std::move(value), envelope, std::nullopt}; }

    NormalizedResult NormalizedResult::of_raw(std::string body) { return {std::move(body), std::nullopt, std::nullopt}; }

    NormalizedResult NormalizedResult::degraded(Value value, std::string error) { return {std::move(value), std::nullopt, std::move(error)}; }

    std::string NormalizedResult::to_string() const {
        if (is_json()) {
            return json().dump();
        }
        if (is_raw()) {
            return raw();
        }
        return "null";
    }

    //
    // ResponseNormalizer implementation
    //

    ResponseNormalizer::ResponseNormalizer(logging::Logger logger, ParseMode mode) : logger_(logging::or_null(std::move(logger))), mode_(mode) {}

    bool ResponseNormalizer::is_json(const http::model::Response& resp) {
        auto content_type = http::model::find_header(resp.headers_, constants::CONTENT_TYPE);
        return content_type && string_utils::icontains(*content_type, "json");
    }

    NormalizedResult ResponseNormalizer::normalize(const http::model::Response& resp, const std::optional<std::string>& entity) const {
        if (!is_json(resp)) {
            return NormalizedResult::of_raw(resp.body_);
        }

        std::optional<json::JsonValue> data;
        try {
            data = json::JsonValue::parse(resp.body_);
            if (!entity || !data->is_object()) {
                return NormalizedResult::of_json(*data);
            }
            return extract(*data, *entity);
        } catch (const std::exception& e) {
            logger_->debug("{} response parsing error: entity={} body={} exception={}", constants::LOG_TAG, entity.value_or("nil"), resp.body_, e.what());

            if (mode_ == ParseMode::STRICT) {
                throw http::http_error::ResponseParseError(entity.value_or(""), resp.body_.substr(0, http::http_error::ERROR_MESSAGE_LENGTH),
                                                           "Failed to parse response: " + std::string(e.what()));
            }
            if (data) {
                return NormalizedResult::degraded(*data, e.what());
            }
            return NormalizedResult::degraded(resp.body_, e.what());
        }
    }

    NormalizedResult ResponseNormalizer::extract(const json::JsonValue& data, const std::string& entity) const {
        const std::string name = entity::entity_name(entity);

        switch (detect_envelope(data)) {
            case Envelope::QUERY_LIST: {
                const json::JsonValue body = *data.find(QUERY_RESPONSE);
                if (body.empty()) {
                    return NormalizedResult::nil(Envelope::QUERY_LIST);
                }
                if (auto found = body.find(name)) {
                    return NormalizedResult::of_json(*found, Envelope::QUERY_LIST);
                }
                return NormalizedResult::of_json(body, Envelope::QUERY_LIST);
            }
            case Envelope::ATTACHABLE_LIST: {
                const json::JsonValue list = *data.find(ATTACHABLE_RESPONSE);
                if (list.is_null()) {
                    return NormalizedResult::nil(Envelope::ATTACHABLE_LIST);
                }
                // An empty list has no first element; that is an empty result, not an error.
                auto first = list.first();
                if (!first || first->is_null()) {
                    return NormalizedResult::nil(Envelope::ATTACHABLE_LIST);
                }
                if (auto found = first->find(name)) {
                    return NormalizedResult::of_json(*found, Envelope::ATTACHABLE_LIST);
                }
                return NormalizedResult::of_json(*first, Envelope::ATTACHABLE_LIST);
            }
            case Envelope::SINGLE_ENTITY:
            case Envelope::GENERIC:
                break;
        }

        if (auto found = data.find(name)) {
            return NormalizedResult::of_json(*found, Envelope::SINGLE_ENTITY);
        }
        logger_->debug("{} entity name not in response body: entity={} entity_name={} body={}", constants::LOG_TAG, entity, name, data.dump());
        return NormalizedResult::of_json(data, Envelope::GENERIC);
    }
}  // namespace qbo

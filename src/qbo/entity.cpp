#include "entity.hpp"

#include <array>
#include <cctype>
#include <string>

#include "../utils/string_utils.hpp"

namespace qbo::entity {
    namespace {
        // Plural-looking names the API uses as-is.
        constexpr std::array<std::string_view, 2> UNCOUNTED = {"Entitlements", "Preferences"};
    }  // namespace

    std::string snake_to_camel(std::string_view label) {
        std::string out;
        out.reserve(label.size());
        bool upper_next = true;
        for (const char c : label) {
            if (c == '_') {
                upper_next = true;
                continue;
            }
            out.push_back(upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
            upper_next = false;
        }
        return out;
    }

    std::string entity_name(std::string_view label) {
        std::string name = snake_to_camel(label);

        if (name == "Classes") {
            return "Class";
        }
        for (const auto& uncounted : UNCOUNTED) {
            if (name == uncounted) {
                return name;
            }
        }
        if (string_utils::ends_with(name, "ies")) {
            name.replace(name.size() - 3, 3, "y");
            return name;
        }
        if (string_utils::ends_with(name, "s") && !string_utils::ends_with(name, "ss")) {
            name.pop_back();
        }
        return name;
    }
}  // namespace qbo::entity

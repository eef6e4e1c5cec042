#ifndef QBO_LINK_ENTITY_HPP
#define QBO_LINK_ENTITY_HPP

#include <string>
#include <string_view>

namespace qbo::entity {
    // "journal_entry" -> "JournalEntry". CamelCase input passes through.
    std::string snake_to_camel(std::string_view label);

    // Key the API uses for an entity inside a response envelope:
    // "customers" -> "Customer", "classes" -> "Class", "preferences" -> "Preferences".
    std::string entity_name(std::string_view label);
}  // namespace qbo::entity

#endif

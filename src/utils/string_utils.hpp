#ifndef QBO_LINK_STRING_UTILS_HPP
#define QBO_LINK_STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace string_utils {
    using KeyValues = std::vector<std::pair<std::string, std::string>>;

    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);

    bool icontains(std::string_view haystack, std::string_view needle);

    std::string trim(std::string s);

    std::string to_lower(std::string s);

    std::string to_upper(std::string s);

    bool starts_with(std::string_view s, std::string_view prefix);

    bool ends_with(std::string_view s, std::string_view suffix);

    // RFC 3986 percent-encoding: everything except ALPHA / DIGIT / "-" / "." / "_" / "~".
    std::string url_encode(std::string_view s);

    // Decodes %XX escapes and '+' as space (form encoding).
    std::string url_decode(std::string_view s);

    // "a=1&b=2" -> {{"a","1"},{"b","2"}}, values decoded.
    KeyValues parse_query(std::string_view query);

    // {{"a","1"},{"b","x y"}} -> "a=1&b=x%20y"
    std::string build_query(const KeyValues& params);
}  // namespace string_utils

#endif

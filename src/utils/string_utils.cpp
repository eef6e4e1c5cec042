#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "constants.hpp"

namespace string_utils {
    namespace {
        constexpr const char* HEX_DIGITS = "0123456789ABCDEF";

        bool is_unreserved(unsigned char c) { return std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~'; }

        int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + constants::BASE_10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + constants::BASE_10;
            }
            return -1;
        }
    }  // namespace

    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    bool icontains(std::string_view haystack, std::string_view needle) {
        auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
        return it != haystack.end() || needle.empty();
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    bool starts_with(std::string_view s, std::string_view prefix) { return s.substr(0, prefix.size()) == prefix; }

    bool ends_with(std::string_view s, std::string_view suffix) {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    std::string url_encode(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (const char ch : s) {
            const auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c)) {
                out.push_back(ch);
            } else {
                out.push_back('%');
                out.push_back(HEX_DIGITS[c >> 4U]);
                out.push_back(HEX_DIGITS[c & 0x0FU]);
            }
        }
        return out;
    }

    std::string url_decode(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '+') {
                out.push_back(' ');
            } else if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
                out.push_back(static_cast<char>((hex_value(s[i + 1]) << 4) | hex_value(s[i + 2])));
                i += 2;
            } else {
                out.push_back(s[i]);
            }
        }
        return out;
    }

    KeyValues parse_query(std::string_view query) {
        KeyValues out;
        size_t start = 0;
        while (start <= query.size()) {
            size_t pos = query.find('&', start);
            size_t end = (pos == std::string_view::npos) ? query.size() : pos;

            std::string_view pair = query.substr(start, end - start);
            if (!pair.empty()) {
                const auto eq = pair.find('=');
                if (eq == std::string_view::npos) {
                    out.emplace_back(url_decode(pair), "");
                } else {
                    out.emplace_back(url_decode(pair.substr(0, eq)), url_decode(pair.substr(eq + 1)));
                }
            }

            if (pos == std::string_view::npos) {
                break;
            }
            start = pos + 1;
        }
        return out;
    }

    std::string build_query(const KeyValues &params) {
        std::string out;
        for (const auto &[key, value] : params) {
            if (!out.empty()) {
                out.push_back('&');
            }
            out += url_encode(key);
            out.push_back('=');
            out += url_encode(value);
        }
        return out;
    }
}  // namespace string_utils

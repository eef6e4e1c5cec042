#ifndef QBO_LINK_MODEL_HPP
#define QBO_LINK_MODEL_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace http::model {
    // Header names compare case-insensitively, values are kept verbatim.
    struct CaseInsensitiveLess {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const {
            return string_utils::to_lower(std::string(a)) < string_utils::to_lower(std::string(b));
        }
    };

    using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;
    using Params = string_utils::KeyValues;

    struct Part {
        std::string name_;
        std::string filename_;
        std::string content_type_;
        std::string data_;
    };

    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::string body_;

        Headers headers_;

        // Consumed by the request-encoding middleware when body_ is empty.
        Params form_;
        std::vector<Part> parts_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;

        Headers headers_;
    };

    inline std::optional<std::string> find_header(const Headers& headers, std::string_view name) {
        auto it = headers.find(name);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}  // namespace http::model

#endif

#ifndef QBO_LINK_QBO_ERRORS_HPP
#define QBO_LINK_QBO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace qbo {
    // Caller configuration bug (missing or inconsistent credentials, bad settings). Never
    // transient, never retried.
    struct ConfigurationError : public std::runtime_error {
        explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
    };
}  // namespace qbo

#endif

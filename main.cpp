#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/json/json_value.hpp"
#include "src/log/log.hpp"
#include "src/qbo/client.hpp"
#include "src/qbo/config.hpp"
#include "src/qbo/errors.hpp"

namespace {
    void print_usage() {
        std::cerr << "usage: qbo_link <GET|POST|PUT|DELETE> <path> [entity] [payload-json]\n"
                  << "       qbo_link disconnect\n"
                  << "       qbo_link reconnect\n"
                  << "credentials and company are read from the QBO_* environment variables\n";
    }
}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 1;
    }

    try {
        http::client::CurlGlobal curl_global;

        const qbo::ClientConfig config = qbo::ClientConfig::from_env();
        auto logger = logging::console_logger("qbo_link", config.log_ ? spdlog::level::debug : spdlog::level::warn);

        qbo::Client client(config, nullptr, logger);

        std::optional<qbo::NormalizedResult> result;
        if (args[0] == "disconnect") {
            result = client.disconnect();
        } else if (args[0] == "reconnect") {
            result = client.reconnect();
        } else {
            if (args.size() < 2) {
                print_usage();
                return 1;
            }

            qbo::RequestArgs request_args;
            if (args.size() > 2 && !args[2].empty()) {
                request_args.entity_ = args[2];
            }
            if (args.size() > 3) {
                request_args.payload_ = json::JsonValue::parse(args[3]);
            }
            result = client.request(args[0], args[1], request_args);
        }

        if (result->is_degraded()) {
            logger->warn("response could not be fully parsed: {}", *result->error());
        }
        std::cout << result->to_string() << std::endl;
    } catch (const http::http_error::HttpError& e) {
        std::cerr << "HTTP Error (" << http::http_error::to_string(e.kind_) << "): " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const qbo::ConfigurationError& e) {
        std::cerr << "Configuration Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid Argument: " << e.what() << std::endl;
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

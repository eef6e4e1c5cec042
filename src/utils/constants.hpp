
#ifndef QBO_LINK_CONSTANTS_HPP
#define QBO_LINK_CONSTANTS_HPP

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;

    inline constexpr const char* LOG_TAG = "[QuickBooks]";

    inline constexpr const char* ACCEPT = "Accept";
    inline constexpr const char* AUTHORIZATION = "Authorization";
    inline constexpr const char* CONTENT_TYPE = "Content-Type";

    inline constexpr const char* JSON_ACCEPT = "application/json;charset=UTF-8";
    inline constexpr const char* JSON_CONTENT_TYPE = "application/json";
    inline constexpr const char* FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";
    inline constexpr const char* MULTIPART_CONTENT_TYPE = "multipart/form-data";

    inline constexpr const char* GET = "GET";
    inline constexpr const char* POST = "POST";
    inline constexpr const char* PUT = "PUT";
    inline constexpr const char* DELETE = "DELETE";
}  // namespace constants

#endif

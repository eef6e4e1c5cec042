#ifndef QBO_LINK_CURL_GLOBAL_HPP
#define QBO_LINK_CURL_GLOBAL_HPP

namespace http::client {

    // curl_global_init/cleanup for the lifetime of the process entry point.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif

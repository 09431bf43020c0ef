#ifndef MIRRORUP_CURL_HPP
#define MIRRORUP_CURL_HPP

#include <optional>
#include <string>

extern "C"
{
#include <curl/curl.h>
}

#include <mirrorup/export.hpp>

namespace mirrorup
{
    class CURLHandle;

    enum class ssl_backend_t
    {
        none = CURLSSLBACKEND_NONE,
        openssl = CURLSSLBACKEND_OPENSSL,
        gnutls = CURLSSLBACKEND_GNUTLS,
        wolfssl = CURLSSLBACKEND_WOLFSSL,
        mbedtls = CURLSSLBACKEND_MBEDTLS,
        bearssl = CURLSSLBACKEND_BEARSSL,
        rustls = CURLSSLBACKEND_RUSTLS,
    };

    struct MIRRORUP_API Response
    {
        long http_status = 0;
        std::string effective_url;

        // Value of the Content-Length header, -1 if the server did not send one.
        curl_off_t content_length = -1;
        // Whole transfer including name resolution and connect, in microseconds.
        curl_off_t total_time = 0;

        // 2xx for HTTP(S), any completed transfer for file:// urls.
        bool ok() const;

        void fill_values(CURLHandle& handle);

        // Only filled when the default callbacks are used (e.g. by `CURLHandle::perform()`)
        std::optional<std::string> content;
    };

}

#endif

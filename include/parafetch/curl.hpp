#ifndef PARAFETCH_CURL_HPP
#define PARAFETCH_CURL_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <parafetch/export.hpp>

namespace parafetch
{
    class CURLHandle;

    enum class ssl_backend_t
    {
        none = CURLSSLBACKEND_NONE,
        openssl = CURLSSLBACKEND_OPENSSL,
        gnutls = CURLSSLBACKEND_GNUTLS,
        nss = CURLSSLBACKEND_NSS,
        wolfssl = CURLSSLBACKEND_WOLFSSL,
        schannel = CURLSSLBACKEND_SCHANNEL,
        securetransport = CURLSSLBACKEND_SECURETRANSPORT,
        mbedtls = CURLSSLBACKEND_MBEDTLS,
        bearssl = CURLSSLBACKEND_BEARSSL,
        rustls = CURLSSLBACKEND_RUSTLS,
    };

    // Status line and headers of one request. Header keys are lower-case.
    struct PARAFETCH_API Response
    {
        std::map<std::string, std::string> headers;

        long http_status = 0;
        std::string effective_url;

        tl::expected<std::string, std::out_of_range> get_header(const std::string& header) const;

        void fill_values(CURLHandle& handle);

        // Only filled when the body is collected by `CURLHandle::perform()`.
        std::optional<std::string> content;
    };
}

#endif

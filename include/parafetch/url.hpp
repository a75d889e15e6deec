#ifndef PARAFETCH_URL_HPP
#define PARAFETCH_URL_HPP

#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <parafetch/export.hpp>
#include <parafetch/enums.hpp>
#include <parafetch/errors.hpp>

namespace parafetch
{
    // Parsed resource locator backed by libcurl's URL API.
    class PARAFETCH_API URLHandler
    {
    public:
        URLHandler();
        // Throws `download_error` (PF_INVALID_LOCATOR) when `url` cannot be parsed.
        explicit URLHandler(const std::string& url);
        ~URLHandler();

        URLHandler(const URLHandler&);
        URLHandler& operator=(const URLHandler&);
        URLHandler(URLHandler&&) noexcept;
        URLHandler& operator=(URLHandler&&) noexcept;

        // Parses `url` and accepts only the http, https and ftp schemes with a host.
        static tl::expected<URLHandler, DownloaderError> parse(const std::string& url);

        std::string url() const;
        std::string scheme() const;
        std::string host() const;
        std::string port() const;
        std::string path() const;
        std::string query() const;
        std::string user() const;
        std::string password() const;

        Protocol protocol() const;

        // Last path segment, percent-decoded. Empty when the path ends with '/'.
        std::string file_name() const;

    private:
        std::string get_part(CURLUPart part, unsigned int flags = 0) const;

        CURLU* m_handle;
    };
}

#endif

#ifndef PARAFETCH_SRC_CURL_INTERNAL_HPP
#define PARAFETCH_SRC_CURL_INTERNAL_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <parafetch/export.hpp>
#include <parafetch/utils.hpp>
#include <parafetch/enums.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/curl.hpp>

namespace parafetch
{
    class Context;
    struct FtpRequest;
    using proxy_map_type = std::map<std::string, std::string>;

    class PARAFETCH_API curl_error : public std::runtime_error
    {
    public:
        curl_error(const std::string& what = "download error", CURLcode code = CURLE_OK);
        CURLcode code() const;

    private:
        CURLcode m_code;
    };

    // RAII owner of one easy handle, configured from the Context.
    class PARAFETCH_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle& url(const std::string& url, const proxy_map_type& proxies);
        CURLHandle& accept_encoding();
        CURLHandle& user_agent(const std::string& user_agent);

        // Runs the transfer collecting headers and body into the returned Response.
        // Throws `curl_error` when the transfer fails.
        Response perform();

        // Runs the transfer with the callbacks set by the caller.
        CURLcode perform_transfer();
        const char* error_message() const;

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

    private:
        void init_handle(const Context& ctx);
        void set_default_callbacks(Response& response);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char errorbuffer[CURL_ERROR_SIZE];
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)), ok);
        }
        return *this;
    }

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option);

    // Appends a raw header line to `headers`, starting over on every status line
    // so that only the headers of the final response after redirects are kept.
    PARAFETCH_API void collect_header(std::map<std::string, std::string>& headers,
                                      const std::string_view& line);

    // Maps a failed transfer to the error taxonomy of the library.
    PARAFETCH_API DownloaderError from_curl_code(CURLcode code, const std::string& reason);

    // Like `from_curl_code()`, keeping a rejected login apart from an
    // unreachable server.
    PARAFETCH_API DownloaderError ftp_error(CURLcode rc,
                                            const FtpRequest& request,
                                            const char* detail);

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url);
}

namespace parafetch::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        explicit CURLSetup(const std::optional<ssl_backend_t>& ssl_backend);
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif

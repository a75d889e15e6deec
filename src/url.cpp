#include <utility>

#include <fmt/format.h>

#include <parafetch/url.hpp>
#include <parafetch/utils.hpp>

namespace parafetch
{
    namespace
    {
        DownloaderError locator_error(const std::string& url, const std::string& what)
        {
            return DownloaderError{ ErrorLevel::FATAL,
                                    ErrorCode::PF_INVALID_LOCATOR,
                                    fmt::format("Invalid locator '{}': {}", url, what) };
        }
    }

    URLHandler::URLHandler()
        : m_handle(curl_url())
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }
    }

    URLHandler::URLHandler(const std::string& url)
        : URLHandler()
    {
        CURLUcode rc = curl_url_set(m_handle, CURLUPART_URL, url.c_str(), 0);
        if (rc != CURLUE_OK)
        {
            throw download_error(locator_error(url, curl_url_strerror(rc)));
        }
    }

    URLHandler::~URLHandler()
    {
        if (m_handle)
        {
            curl_url_cleanup(m_handle);
        }
    }

    URLHandler::URLHandler(const URLHandler& rhs)
        : m_handle(curl_url_dup(rhs.m_handle))
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }
    }

    URLHandler& URLHandler::operator=(const URLHandler& rhs)
    {
        if (this != &rhs)
        {
            URLHandler tmp(rhs);
            std::swap(m_handle, tmp.m_handle);
        }
        return *this;
    }

    URLHandler::URLHandler(URLHandler&& rhs) noexcept
        : m_handle(rhs.m_handle)
    {
        rhs.m_handle = nullptr;
    }

    URLHandler& URLHandler::operator=(URLHandler&& rhs) noexcept
    {
        std::swap(m_handle, rhs.m_handle);
        return *this;
    }

    tl::expected<URLHandler, DownloaderError> URLHandler::parse(const std::string& url)
    {
        URLHandler handler;
        CURLUcode rc = curl_url_set(handler.m_handle, CURLUPART_URL, url.c_str(), 0);
        if (rc != CURLUE_OK)
        {
            return tl::unexpected(locator_error(url, curl_url_strerror(rc)));
        }
        if (handler.protocol() == Protocol::kOTHER)
        {
            return tl::unexpected(
                locator_error(url, fmt::format("unsupported scheme '{}'", handler.scheme())));
        }
        if (handler.host().empty())
        {
            return tl::unexpected(locator_error(url, "missing host"));
        }
        return handler;
    }

    std::string URLHandler::get_part(CURLUPart part, unsigned int flags) const
    {
        if (m_handle == nullptr)
        {
            return {};
        }
        char* value = nullptr;
        CURLUcode rc = curl_url_get(m_handle, part, &value, flags);
        if (rc != CURLUE_OK || value == nullptr)
        {
            // missing optional parts (user, port, query, ...) are reported as errors
            return {};
        }
        std::string res(value);
        curl_free(value);
        return res;
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::port() const
    {
        return get_part(CURLUPART_PORT);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    std::string URLHandler::query() const
    {
        return get_part(CURLUPART_QUERY);
    }

    std::string URLHandler::user() const
    {
        return get_part(CURLUPART_USER, CURLU_URLDECODE);
    }

    std::string URLHandler::password() const
    {
        return get_part(CURLUPART_PASSWORD, CURLU_URLDECODE);
    }

    Protocol URLHandler::protocol() const
    {
        std::string s = to_lower(scheme());
        if (s == "http" || s == "https")
        {
            return Protocol::kHTTP;
        }
        if (s == "ftp")
        {
            return Protocol::kFTP;
        }
        return Protocol::kOTHER;
    }

    std::string URLHandler::file_name() const
    {
        std::string p = get_part(CURLUPART_PATH, CURLU_URLDECODE);
        auto pos = p.find_last_of('/');
        if (pos == std::string::npos)
        {
            return p;
        }
        return p.substr(pos + 1);
    }
}

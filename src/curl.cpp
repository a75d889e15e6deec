#include <atomic>

#include <spdlog/spdlog.h>

#include <parafetch/context.hpp>
#include <parafetch/curl.hpp>
#include <parafetch/url.hpp>
#include <parafetch/utils.hpp>

#include "curl_internal.hpp"

namespace parafetch
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what, CURLcode code)
        : std::runtime_error(what)
        , m_code(code)
    {
    }

    CURLcode curl_error::code() const
    {
        return m_code;
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, errorbuffer);
        init_handle(ctx);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_NETRC, (long) CURL_NETRC_OPTIONAL);
        setopt(CURLOPT_MAXREDIRS, ctx.max_redirects);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        // worker threads must not receive SIGALRM from the resolver
        setopt(CURLOPT_NOSIGNAL, 1L);

        if (ctx.disable_ssl)
        {
            spdlog::debug("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }

            if (ctx.ssl_no_revoke)
            {
                setopt(CURLOPT_SSL_OPTIONS, (long) CURLSSLOPT_NO_REVOKE);
            }
        }

        setopt(CURLOPT_FTP_USE_EPSV, (long) ctx.ftp_use_seepsv);

        if (ctx.verbosity > 2)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url, ctx.proxy_map);
        add_headers(ctx.additional_httpheaders);
        user_agent(ctx.user_agent);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url);
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value());
        }
        return *this;
    }

    CURLHandle& CURLHandle::accept_encoding()
    {
        setopt(CURLOPT_ACCEPT_ENCODING, "");
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        add_header(fmt::format("User-Agent: {} {}", user_agent, curl_version()));
        return *this;
    }

    namespace
    {
        std::size_t string_callback(char* buffer,
                                    std::size_t size,
                                    std::size_t nitems,
                                    std::string* string)
        {
            string->append(buffer, size * nitems);
            return size * nitems;
        }

        std::size_t header_map_callback(char* buffer,
                                        std::size_t size,
                                        std::size_t nitems,
                                        std::map<std::string, std::string>* header_map)
        {
            try
            {
                collect_header(*header_map, std::string_view(buffer, size * nitems));
            }
            catch (const std::exception& e)
            {
                spdlog::error("Reading headers failed: {}", e.what());
                return 0;
            }
            return size * nitems;
        }
    }

    void collect_header(std::map<std::string, std::string>& headers, const std::string_view& line)
    {
        if (starts_with(line, "HTTP/"))
        {
            headers.clear();
            return;
        }
        auto kv = parse_header(line);
        if (!kv.first.empty())
        {
            headers[kv.first] = kv.second;
        }
    }

    void CURLHandle::set_default_callbacks(Response& response)
    {
        setopt(CURLOPT_HEADERFUNCTION, header_map_callback);
        setopt(CURLOPT_HEADERDATA, &response.headers);

        response.content = std::string();
        setopt(CURLOPT_WRITEFUNCTION, string_callback);
        setopt(CURLOPT_WRITEDATA, &response.content.value());
    }

    Response CURLHandle::perform()
    {
        Response response;
        set_default_callbacks(response);
        CURLcode curl_result = perform_transfer();
        if (curl_result != CURLE_OK)
        {
            throw curl_error(fmt::format("{} [{}]", curl_easy_strerror(curl_result), errorbuffer),
                             curl_result);
        }
        response.fill_values(*this);
        return response;
    }

    CURLcode CURLHandle::perform_transfer()
    {
        errorbuffer[0] = '\0';
        return curl_easy_perform(handle());
    }

    const char* CURLHandle::error_message() const
    {
        return errorbuffer;
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<double, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (res && res.value() != nullptr)
            return std::string(res.value());
        else if (res)
            return std::string();
        else
            return tl::unexpected(res.error());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        curl_slist* headers = curl_slist_append(p_headers, header.c_str());
        if (!headers)
        {
            throw std::bad_alloc();
        }
        p_headers = headers;
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    /************
     * Response *
     ************/

    tl::expected<std::string, std::out_of_range> Response::get_header(
        const std::string& header) const
    {
        auto it = headers.find(to_lower(header));
        if (it != headers.end())
            return it->second;
        else
            return tl::unexpected(
                std::out_of_range(std::string("Could not find header ") + header));
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    DownloaderError from_curl_code(CURLcode code, const std::string& reason)
    {
        switch (code)
        {
            case CURLE_ABORTED_BY_CALLBACK:
                return DownloaderError{ ErrorLevel::INFO, ErrorCode::PF_CANCELLED, reason };
            case CURLE_OPERATION_TIMEDOUT:
                return DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_TIMEOUT, reason };
            case CURLE_LOGIN_DENIED:
            case CURLE_REMOTE_ACCESS_DENIED:
                return DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_UNAUTHORIZED, reason };
            case CURLE_REMOTE_FILE_NOT_FOUND:
                return DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_NOT_FOUND, reason };
            case CURLE_URL_MALFORMAT:
            case CURLE_UNSUPPORTED_PROTOCOL:
                return DownloaderError{ ErrorLevel::FATAL, ErrorCode::PF_INVALID_LOCATOR, reason };
            case CURLE_WRITE_ERROR:
                return DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_IO, reason };
            default:
                return DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_TRANSPORT, reason };
        }
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // This is a reimplementation of requests.utils.select_proxy()
        // of the python requests library
        if (proxies.empty())
        {
            return std::nullopt;
        }

        auto handler = URLHandler::parse(url);
        if (!handler)
        {
            return std::nullopt;
        }
        auto scheme = handler->scheme();
        auto host = handler->host();
        std::vector<std::string> options;

        if (host.empty())
        {
            options = {
                scheme,
                "all",
            };
        }
        else
        {
            options = { scheme + "://" + host, scheme, "all://" + host, "all" };
        }

        for (auto& option : options)
        {
            auto proxy = proxies.find(option);
            if (proxy != proxies.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup(const std::optional<ssl_backend_t>& ssl_backend)
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "parafetch::CURLSetup created more than once - instance must be unique");
            }

            if (ssl_backend)
            {
                const auto res = curl_global_sslset(
                    (curl_sslbackend) ssl_backend.value(), nullptr, nullptr);
                if (res != CURLSSLSET_OK)
                {
                    is_curl_setup_alive = false;
                    if (res == CURLSSLSET_UNKNOWN_BACKEND)
                        throw curl_error("unknown curl ssl backend");
                    else if (res == CURLSSLSET_NO_BACKENDS)
                        throw curl_error("no curl ssl backend available");
                    else if (res == CURLSSLSET_TOO_LATE)
                        throw curl_error("curl ssl backend set too late");
                    throw curl_error("failed to set curl ssl backend");
                }
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}

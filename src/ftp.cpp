#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <parafetch/context.hpp>
#include <parafetch/ftp.hpp>

#include "curl_internal.hpp"

namespace parafetch
{
    namespace
    {
        struct FtpTransfer
        {
            const FtpClient::sink_type* sink = nullptr;
            const FtpClient::abort_type* should_abort = nullptr;
            bool refused = false;
            bool aborted = false;
        };

        std::size_t write_callback(char* buffer,
                                   std::size_t size,
                                   std::size_t nitems,
                                   FtpTransfer* self)
        {
            const std::size_t all = size * nitems;
            try
            {
                if (!(*self->sink)(buffer, all))
                {
                    self->refused = true;
                    return 0;
                }
            }
            catch (const std::exception& e)
            {
                spdlog::error("Receiving FTP data failed: {}", e.what());
                self->refused = true;
                return 0;
            }
            return all;
        }

        int progress_callback(FtpTransfer* self,
                              curl_off_t /*total_to_download*/,
                              curl_off_t /*now_downloaded*/,
                              curl_off_t /*total_to_upload*/,
                              curl_off_t /*now_uploaded*/)
        {
            if (*self->should_abort && (*self->should_abort)())
            {
                self->aborted = true;
                return 1;
            }
            return 0;
        }
    }

    DownloaderError ftp_error(CURLcode rc, const FtpRequest& request, const char* detail)
    {
        switch (rc)
        {
            case CURLE_LOGIN_DENIED:
                return DownloaderError{ ErrorLevel::SERIOUS,
                                        ErrorCode::PF_UNAUTHORIZED,
                                        fmt::format("FTP login as '{}' on {} rejected [{}]",
                                                    request.user,
                                                    request.host,
                                                    detail) };
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_FTP_WEIRD_SERVER_REPLY:
            case CURLE_FTP_ACCEPT_FAILED:
            case CURLE_FTP_CANT_GET_HOST:
                return DownloaderError{ ErrorLevel::SERIOUS,
                                        ErrorCode::PF_TRANSPORT,
                                        fmt::format("Could not connect to FTP server {}: {} [{}]",
                                                    request.host,
                                                    curl_easy_strerror(rc),
                                                    detail) };
            default:
                return from_curl_code(rc,
                                      fmt::format("FTP retrieval of {} failed: {} [{}]",
                                                  request.path,
                                                  curl_easy_strerror(rc),
                                                  detail));
        }
    }

    CurlFtpClient::CurlFtpClient(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    tl::expected<void, DownloaderError> CurlFtpClient::retrieve(const FtpRequest& request,
                                                                const sink_type& sink,
                                                                const abort_type& should_abort)
    {
        try
        {
            std::string url = "ftp://" + request.host;
            if (!request.port.empty())
            {
                url += ":" + request.port;
            }
            url += request.path;

            CURLHandle h(m_ctx);
            h.url(url, m_ctx.proxy_map);
            h.setopt(CURLOPT_USERNAME, request.user.empty() ? std::string("anonymous")
                                                            : request.user);
            h.setopt(CURLOPT_PASSWORD, request.password);
            if (request.timeout)
            {
                if (request.timeout->count() <= 0)
                {
                    return tl::unexpected(DownloaderError{
                        ErrorLevel::SERIOUS,
                        ErrorCode::PF_TIMEOUT,
                        fmt::format("No time left to retrieve {}", url) });
                }
                h.setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout->count()));
            }

            FtpTransfer state;
            state.sink = &sink;
            state.should_abort = &should_abort;

            h.setopt(CURLOPT_WRITEFUNCTION, &write_callback);
            h.setopt(CURLOPT_WRITEDATA, &state);
            h.setopt(CURLOPT_XFERINFOFUNCTION, &progress_callback);
            h.setopt(CURLOPT_XFERINFODATA, &state);
            h.setopt(CURLOPT_NOPROGRESS, 0L);

            spdlog::debug("RETR {}", url);
            CURLcode rc = h.perform_transfer();

            if (state.aborted)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::INFO,
                    ErrorCode::PF_CANCELLED,
                    fmt::format("FTP retrieval of {} was cancelled", request.path) });
            }
            if (state.refused)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::PF_IO,
                    fmt::format("FTP data of {} was refused by the receiver", request.path) });
            }
            if (rc != CURLE_OK)
            {
                return tl::unexpected(ftp_error(rc, request, h.error_message()));
            }
            return {};
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(from_curl_code(e.code(), e.what()));
        }
    }
}

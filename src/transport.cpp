#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <parafetch/context.hpp>
#include <parafetch/transport.hpp>

#include "curl_internal.hpp"

namespace parafetch
{
    namespace
    {
        struct TransferState
        {
            const FetchHandlers* handlers = nullptr;
            CURLHandle* handle = nullptr;
            Response response;
            bool response_delivered = false;
            // a handler returned false
            bool refused = false;
            // should_abort fired
            bool aborted = false;
        };

        bool deliver_response(TransferState& self)
        {
            if (self.response_delivered)
            {
                return !self.refused;
            }
            self.response_delivered = true;
            self.response.fill_values(*self.handle);
            if (self.handlers->on_response && !self.handlers->on_response(self.response))
            {
                self.refused = true;
                return false;
            }
            return true;
        }

        std::size_t header_callback(char* buffer,
                                    std::size_t size,
                                    std::size_t nitems,
                                    TransferState* self)
        {
            try
            {
                collect_header(self->response.headers, std::string_view(buffer, size * nitems));
            }
            catch (const std::exception& e)
            {
                spdlog::error("Reading headers failed: {}", e.what());
                self->refused = true;
                return 0;
            }
            return size * nitems;
        }

        std::size_t write_callback(char* buffer,
                                   std::size_t size,
                                   std::size_t nitems,
                                   TransferState* self)
        {
            const std::size_t all = size * nitems;
            try
            {
                if (!deliver_response(*self))
                {
                    // a short count makes curl fail with CURLE_WRITE_ERROR
                    return 0;
                }
                if (self->handlers->on_data && !self->handlers->on_data(buffer, all))
                {
                    self->refused = true;
                    return 0;
                }
            }
            catch (const std::exception& e)
            {
                // exceptions must not unwind through libcurl
                spdlog::error("Receiving data failed: {}", e.what());
                self->refused = true;
                return 0;
            }
            return all;
        }

        int progress_callback(TransferState* self,
                              curl_off_t /*total_to_download*/,
                              curl_off_t /*now_downloaded*/,
                              curl_off_t /*total_to_upload*/,
                              curl_off_t /*now_uploaded*/)
        {
            if (self->handlers->should_abort && self->handlers->should_abort())
            {
                self->aborted = true;
                return 1;
            }
            return 0;
        }

        // Returns false when the remaining budget is already used up.
        bool apply_common_options(CURLHandle& h, const FetchRequest& request)
        {
            if (request.timeout)
            {
                if (request.timeout->count() <= 0)
                {
                    return false;
                }
                h.setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout->count()));
            }

            std::string cookies = cookie_header_value(request.cookies);
            if (!cookies.empty())
            {
                h.setopt(CURLOPT_COOKIE, cookies);
            }
            return true;
        }

        DownloaderError budget_exhausted(const FetchRequest& request)
        {
            return DownloaderError{ ErrorLevel::SERIOUS,
                                    ErrorCode::PF_TIMEOUT,
                                    fmt::format("No time left to request {}", request.url) };
        }
    }

    CurlTransport::CurlTransport(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    tl::expected<Response, DownloaderError> CurlTransport::probe(const FetchRequest& request)
    {
        try
        {
            CURLHandle h(m_ctx, request.url);
            if (!apply_common_options(h, request))
            {
                return tl::unexpected(budget_exhausted(request));
            }
            h.setopt(CURLOPT_NOBODY, 1L);

            spdlog::debug("HEAD {}", request.url);
            return h.perform();
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(from_curl_code(e.code(), e.what()));
        }
    }

    tl::expected<Response, DownloaderError> CurlTransport::fetch(const FetchRequest& request,
                                                                 const FetchHandlers& handlers)
    {
        try
        {
            CURLHandle h(m_ctx, request.url);
            if (!apply_common_options(h, request))
            {
                return tl::unexpected(budget_exhausted(request));
            }

            if (request.range)
            {
                h.setopt(CURLOPT_RANGE, to_range_spec(*request.range));
            }
            else if (request.decode_content)
            {
                // a decoded body no longer matches the byte offsets of a range
                h.accept_encoding();
            }

            TransferState state;
            state.handlers = &handlers;
            state.handle = &h;

            h.setopt(CURLOPT_HEADERFUNCTION, &header_callback);
            h.setopt(CURLOPT_HEADERDATA, &state);
            h.setopt(CURLOPT_WRITEFUNCTION, &write_callback);
            h.setopt(CURLOPT_WRITEDATA, &state);
            h.setopt(CURLOPT_XFERINFOFUNCTION, &progress_callback);
            h.setopt(CURLOPT_XFERINFODATA, &state);
            h.setopt(CURLOPT_NOPROGRESS, 0L);

            spdlog::debug("GET {}{}",
                          request.url,
                          request.range ? " bytes=" + to_range_spec(*request.range) : "");

            CURLcode rc = h.perform_transfer();

            if (state.aborted)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::INFO,
                    ErrorCode::PF_CANCELLED,
                    fmt::format("Transfer of {} was cancelled", request.url) });
            }
            if (state.refused)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::PF_IO,
                    fmt::format("Transfer of {} was refused by the receiver", request.url) });
            }
            if (rc != CURLE_OK)
            {
                return tl::unexpected(from_curl_code(
                    rc,
                    fmt::format("{} [{}] while fetching {}",
                                curl_easy_strerror(rc),
                                h.error_message(),
                                request.url)));
            }

            // empty bodies never reach the write callback
            if (!deliver_response(state))
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::PF_IO,
                    fmt::format("Response of {} was refused by the receiver", request.url) });
            }
            return state.response;
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(from_curl_code(e.code(), e.what()));
        }
    }
}

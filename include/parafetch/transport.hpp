#ifndef PARAFETCH_TRANSPORT_HPP
#define PARAFETCH_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/curl.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/options.hpp>
#include <parafetch/range_planner.hpp>

namespace parafetch
{
    class Context;

    struct FetchRequest
    {
        std::string url;
        // Sent as `Range: bytes=start-end` when set.
        std::optional<ByteRange> range;
        std::vector<Cookie> cookies;
        // Upper bound for the whole request, none when unset.
        std::optional<std::chrono::milliseconds> timeout;
        // Ask the server for a compressed body and decode it on the fly.
        bool decode_content = false;
    };

    struct FetchHandlers
    {
        // Called once with the status and headers before the first body byte
        // (or at the end for an empty body). Returning false aborts the transfer.
        std::function<bool(const Response&)> on_response;
        // Receives the body in arrival order. Returning false aborts the transfer.
        std::function<bool(const char*, std::size_t)> on_data;
        // Polled during the transfer; returning true aborts with PF_CANCELLED.
        std::function<bool()> should_abort;
    };

    // Request/response capability used by the probe and the chunk workers.
    // Implementations must be callable from several threads at once.
    class PARAFETCH_API Transport
    {
    public:
        virtual ~Transport() = default;

        // Metadata request (HEAD), no payload is transferred. Any HTTP status is
        // a successful result; only transport level failures are errors.
        virtual tl::expected<Response, DownloaderError> probe(const FetchRequest& request) = 0;

        // Payload request. Fails with PF_CANCELLED when `should_abort` fired,
        // PF_IO when a handler refused the data, PF_TIMEOUT when the request
        // timeout elapsed and PF_TRANSPORT for any other failure.
        virtual tl::expected<Response, DownloaderError> fetch(const FetchRequest& request,
                                                              const FetchHandlers& handlers)
            = 0;
    };

    class PARAFETCH_API CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(const Context& ctx);

        tl::expected<Response, DownloaderError> probe(const FetchRequest& request) override;
        tl::expected<Response, DownloaderError> fetch(const FetchRequest& request,
                                                      const FetchHandlers& handlers) override;

    private:
        const Context& m_ctx;
    };
}

#endif

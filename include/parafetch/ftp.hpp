#ifndef PARAFETCH_FTP_HPP
#define PARAFETCH_FTP_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/errors.hpp>

namespace parafetch
{
    class Context;

    struct FtpRequest
    {
        std::string host;
        // Empty means the default FTP port.
        std::string port;
        std::string user = "anonymous";
        std::string password;
        // Absolute path of the file on the server.
        std::string path;
        std::optional<std::chrono::milliseconds> timeout;
    };

    // Single-stream retrieval over FTP.
    class PARAFETCH_API FtpClient
    {
    public:
        using sink_type = std::function<bool(const char*, std::size_t)>;
        using abort_type = std::function<bool()>;

        virtual ~FtpClient() = default;

        // Logs in and streams the file to `sink`. A rejected login fails with
        // PF_UNAUTHORIZED, a server that cannot be reached with PF_TRANSPORT.
        virtual tl::expected<void, DownloaderError> retrieve(const FtpRequest& request,
                                                             const sink_type& sink,
                                                             const abort_type& should_abort)
            = 0;
    };

    class PARAFETCH_API CurlFtpClient : public FtpClient
    {
    public:
        explicit CurlFtpClient(const Context& ctx);

        tl::expected<void, DownloaderError> retrieve(const FtpRequest& request,
                                                     const sink_type& sink,
                                                     const abort_type& should_abort) override;

    private:
        const Context& m_ctx;
    };
}

#endif

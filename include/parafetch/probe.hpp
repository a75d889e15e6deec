#ifndef PARAFETCH_PROBE_HPP
#define PARAFETCH_PROBE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/curl.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/options.hpp>
#include <parafetch/transport.hpp>
#include <parafetch/url.hpp>

namespace parafetch
{
    struct ProbeResult
    {
        // Zero when the server did not announce a usable Content-Length.
        std::uint64_t total_size = 0;
        bool supports_range = false;
        std::string suggested_file_name;
        long http_status = 0;
        std::string effective_url;
    };

    // Error for an unsuccessful HTTP status, std::nullopt for 2xx.
    // 404 is PF_NOT_FOUND, 401 and 403 are PF_UNAUTHORIZED, anything else
    // outside 2xx is PF_TRANSPORT.
    PARAFETCH_API std::optional<DownloaderError> classify_status(long http_status,
                                                                 const std::string& url);

    // Interprets the headers of a successful metadata response.
    PARAFETCH_API ProbeResult interpret_probe_response(const Response& response,
                                                       const URLHandler& url);

    // File name from Content-Disposition, falling back to the last path segment
    // of the locator.
    PARAFETCH_API std::string file_name_from_response(const Response& response,
                                                      const URLHandler& url);

    // Runs one metadata request. No payload byte is transferred.
    PARAFETCH_API tl::expected<ProbeResult, DownloaderError> probe_resource(
        Transport& transport,
        const URLHandler& url,
        const std::vector<Cookie>& cookies,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    PARAFETCH_API nlohmann::json to_json(const ProbeResult& result);
}

#endif

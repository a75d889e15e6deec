#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <parafetch/probe.hpp>
#include <parafetch/utils.hpp>

namespace parafetch
{
    std::optional<DownloaderError> classify_status(long http_status, const std::string& url)
    {
        if (http_status / 100 == 2)
        {
            return std::nullopt;
        }
        if (http_status == 404)
        {
            return DownloaderError{ ErrorLevel::SERIOUS,
                                    ErrorCode::PF_NOT_FOUND,
                                    fmt::format("Resource {} does not exist", url) };
        }
        if (http_status == 401 || http_status == 403)
        {
            return DownloaderError{ ErrorLevel::SERIOUS,
                                    ErrorCode::PF_UNAUTHORIZED,
                                    fmt::format("No access to {} (HTTP {})", url, http_status) };
        }
        return DownloaderError{ ErrorLevel::SERIOUS,
                                ErrorCode::PF_TRANSPORT,
                                fmt::format("Server answered HTTP {} for {}", http_status, url) };
    }

    std::string file_name_from_response(const Response& response, const URLHandler& url)
    {
        auto disposition = response.get_header("content-disposition");
        if (disposition)
        {
            auto name = parse_content_disposition(disposition.value());
            if (name)
            {
                return name.value();
            }
            spdlog::debug("Ignoring unusable Content-Disposition: {}", disposition.value());
        }
        return url.file_name();
    }

    ProbeResult interpret_probe_response(const Response& response, const URLHandler& url)
    {
        ProbeResult result;
        result.http_status = response.http_status;
        result.effective_url = response.effective_url;

        auto accept_ranges = response.get_header("accept-ranges");
        result.supports_range = accept_ranges && contains(to_lower(accept_ranges.value()), "bytes");

        std::optional<std::uint64_t> size;
        auto content_length = response.get_header("content-length");
        if (content_length)
        {
            size = parse_size(content_length.value());
        }
        if (size)
        {
            result.total_size = size.value();
        }
        else
        {
            // without a size no range can be formed
            result.total_size = 0;
            result.supports_range = false;
        }

        result.suggested_file_name = file_name_from_response(response, url);
        return result;
    }

    tl::expected<ProbeResult, DownloaderError> probe_resource(
        Transport& transport,
        const URLHandler& url,
        const std::vector<Cookie>& cookies,
        std::optional<std::chrono::milliseconds> timeout)
    {
        FetchRequest request;
        request.url = url.url();
        request.cookies = cookies;
        request.timeout = timeout;

        auto response = transport.probe(request);
        if (!response)
        {
            return tl::unexpected(response.error());
        }
        if (auto error = classify_status(response->http_status, request.url))
        {
            return tl::unexpected(error.value());
        }

        ProbeResult result = interpret_probe_response(response.value(), url);
        spdlog::info("Probed {}: size {}, ranges {}, name '{}'",
                     request.url,
                     result.total_size,
                     result.supports_range ? "supported" : "not supported",
                     result.suggested_file_name);
        return result;
    }

    nlohmann::json to_json(const ProbeResult& result)
    {
        nlohmann::json j;
        j["size"] = result.total_size;
        j["supports_range"] = result.supports_range;
        j["file_name"] = result.suggested_file_name;
        j["status"] = result.http_status;
        j["effective_url"] = result.effective_url;
        return j;
    }
}

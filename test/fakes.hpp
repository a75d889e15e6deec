#ifndef PARAFETCH_TEST_FAKES_HPP
#define PARAFETCH_TEST_FAKES_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <parafetch/destination.hpp>
#include <parafetch/ftp.hpp>
#include <parafetch/transport.hpp>

namespace parafetch::test
{
    // In-memory HTTP server. Serves `body`, answering ranged requests with 206
    // unless `honor_ranges` is off.
    class FakeTransport : public Transport
    {
    public:
        std::string body;
        bool honor_ranges = true;
        bool advertise_ranges = true;
        bool announce_length = true;
        long head_status = 200;
        long get_status = 200;
        std::map<std::string, std::string> extra_headers;
        std::optional<DownloaderError> probe_error;

        // Number of failing attempts before a range starting at the key succeeds.
        std::map<std::uint64_t, int> failures_at;
        // Ranges starting at these offsets always fail.
        std::set<std::uint64_t> broken_at;
        // Ranges starting at these offsets stall until the request is aborted.
        std::set<std::uint64_t> stall_at;
        // Every request without a range stalls until it is aborted.
        bool stall_plain = false;

        std::size_t piece_size = 4096;

        explicit FakeTransport(std::string content = {})
            : body(std::move(content))
        {
        }

        tl::expected<Response, DownloaderError> probe(const FetchRequest& request) override
        {
            ++probe_calls;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                probed_urls.push_back(request.url);
            }
            if (probe_error)
            {
                return tl::unexpected(probe_error.value());
            }
            Response response;
            response.http_status = head_status;
            response.effective_url = request.url;
            response.headers = headers();
            return response;
        }

        tl::expected<Response, DownloaderError> fetch(const FetchRequest& request,
                                                      const FetchHandlers& handlers) override
        {
            ++fetch_calls;
            const std::uint64_t start = request.range ? request.range->start : 0;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                requests.push_back(request);
                ++calls_at[start];
                if (failures_at.count(start) && failures_at[start] > 0)
                {
                    --failures_at[start];
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_TRANSPORT, "reset" });
                }
            }
            if (broken_at.count(start))
            {
                return tl::unexpected(
                    DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_TRANSPORT, "broken" });
            }

            const bool stall = request.range ? stall_at.count(start) > 0 : stall_plain;
            if (stall)
            {
                auto begin = std::chrono::steady_clock::now();
                while (!handlers.should_abort())
                {
                    if (request.timeout
                        && std::chrono::steady_clock::now() - begin >= request.timeout.value())
                    {
                        return tl::unexpected(
                            DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_TIMEOUT, "timeout" });
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                return tl::unexpected(
                    DownloaderError{ ErrorLevel::INFO, ErrorCode::PF_CANCELLED, "aborted" });
            }

            Response response;
            response.effective_url = request.url;
            response.headers = headers();
            std::string payload;
            if (request.range && honor_ranges)
            {
                response.http_status = 206;
                payload = body.substr(request.range->start, request.range->size());
            }
            else
            {
                response.http_status = get_status;
                payload = get_status / 100 == 2 ? body : std::string();
            }

            if (handlers.on_response && !handlers.on_response(response))
            {
                return tl::unexpected(
                    DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_IO, "refused" });
            }
            for (std::size_t pos = 0; pos < payload.size(); pos += piece_size)
            {
                if (handlers.should_abort && handlers.should_abort())
                {
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::INFO, ErrorCode::PF_CANCELLED, "aborted" });
                }
                std::size_t n = std::min(piece_size, payload.size() - pos);
                if (!handlers.on_data(payload.data() + pos, n))
                {
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_IO, "refused" });
                }
            }
            return response;
        }

        int calls_for(std::uint64_t start)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return calls_at[start];
        }

        std::atomic<int> probe_calls{ 0 };
        std::atomic<int> fetch_calls{ 0 };
        std::vector<FetchRequest> requests;
        std::vector<std::string> probed_urls;

    private:
        std::map<std::string, std::string> headers() const
        {
            std::map<std::string, std::string> h = extra_headers;
            if (announce_length)
            {
                h["content-length"] = std::to_string(body.size());
            }
            if (advertise_ranges)
            {
                h["accept-ranges"] = "bytes";
            }
            return h;
        }

        std::mutex m_mutex;
        std::map<std::uint64_t, int> calls_at;
    };

    class FakeFtpClient : public FtpClient
    {
    public:
        std::string data;
        std::optional<DownloaderError> error;
        bool stall = false;
        std::vector<FtpRequest> requests;

        tl::expected<void, DownloaderError> retrieve(const FtpRequest& request,
                                                     const sink_type& sink,
                                                     const abort_type& should_abort) override
        {
            requests.push_back(request);
            if (error)
            {
                return tl::unexpected(error.value());
            }
            while (stall && !should_abort())
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            if (should_abort())
            {
                return tl::unexpected(
                    DownloaderError{ ErrorLevel::INFO, ErrorCode::PF_CANCELLED, "aborted" });
            }
            for (std::size_t pos = 0; pos < data.size(); pos += 1000)
            {
                if (!sink(data.data() + pos, std::min<std::size_t>(1000, data.size() - pos)))
                {
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_IO, "refused" });
                }
            }
            return {};
        }
    };

    class FakeChooser : public DestinationChooser
    {
    public:
        std::optional<fs::path> answer;
        bool accept_suggestion = true;
        std::vector<fs::path> suggestions;

        std::optional<fs::path> choose_save_location(const fs::path& suggested) override
        {
            suggestions.push_back(suggested);
            if (answer)
            {
                return answer;
            }
            if (accept_suggestion)
            {
                return suggested;
            }
            return std::nullopt;
        }
    };

    // Fresh directory below the system temp dir, removed again on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            m_path = fs::temp_directory_path()
                     / ("parafetch-test-" + std::to_string(rd()) + std::to_string(rd()));
            fs::create_directories(m_path);
        }

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        const fs::path& path() const
        {
            return m_path;
        }

    private:
        fs::path m_path;
    };

    inline std::string read_file(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    inline std::string make_payload(std::size_t size)
    {
        std::string payload(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            payload[i] = static_cast<char>('a' + (i * 7 + i / 251) % 26);
        }
        return payload;
    }
}

#endif

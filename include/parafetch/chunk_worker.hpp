#ifndef PARAFETCH_CHUNK_WORKER_HPP
#define PARAFETCH_CHUNK_WORKER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/cancellation.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/options.hpp>
#include <parafetch/range_planner.hpp>
#include <parafetch/transport.hpp>
#include <parafetch/write_coordinator.hpp>

namespace parafetch
{
    struct ChunkTask
    {
        std::size_t job_id = 0;
        std::size_t index = 0;
        std::string url;
        ByteRange range;
        // false: fetch the whole resource with a plain request and write it from
        // offset 0. `range` then only carries the expected size, if known.
        bool ranged = true;
        std::uint64_t expected_size = 0;
        std::vector<Cookie> cookies;
    };

    struct RetryPolicy
    {
        // Retries after the first attempt.
        int max_retries = 3;
        std::chrono::milliseconds delay{ 0 };
    };

    // Fetches one range into the shared destination file.
    //
    // Each attempt restarts at the range start. Transport failures and a server
    // ignoring the range (any status but 206) consume a retry. A tripped token
    // or an expired deadline ends the worker without consuming one. When the
    // retries are exhausted the last error trips the token, stopping siblings.
    class PARAFETCH_API ChunkWorker
    {
    public:
        ChunkWorker(Transport& transport,
                    WriteCoordinator& sink,
                    CancellationToken& token,
                    RetryPolicy policy = {});

        tl::expected<void, DownloaderError> run(const ChunkTask& task);

        // Number of requests issued by the last `run()`.
        int attempts() const noexcept;
        std::uint64_t bytes_received() const noexcept;

    private:
        tl::expected<void, DownloaderError> attempt(const ChunkTask& task);
        std::optional<DownloaderError> stop_reason(const ChunkTask& task);

        Transport& m_transport;
        WriteCoordinator& m_sink;
        CancellationToken& m_token;
        RetryPolicy m_policy;

        int m_attempts = 0;
        std::uint64_t m_received = 0;
    };
}

#endif

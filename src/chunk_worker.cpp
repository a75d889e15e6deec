#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <parafetch/chunk_worker.hpp>
#include <parafetch/probe.hpp>

namespace parafetch
{
    ChunkWorker::ChunkWorker(Transport& transport,
                             WriteCoordinator& sink,
                             CancellationToken& token,
                             RetryPolicy policy)
        : m_transport(transport)
        , m_sink(sink)
        , m_token(token)
        , m_policy(policy)
    {
    }

    int ChunkWorker::attempts() const noexcept
    {
        return m_attempts;
    }

    std::uint64_t ChunkWorker::bytes_received() const noexcept
    {
        return m_received;
    }

    std::optional<DownloaderError> ChunkWorker::stop_reason(const ChunkTask& task)
    {
        if (m_token.check_deadline())
        {
            return DownloaderError{
                ErrorLevel::INFO,
                ErrorCode::PF_CANCELLED,
                fmt::format("[job {}] chunk {} stopped by cancellation", task.job_id, task.index) };
        }
        return std::nullopt;
    }

    tl::expected<void, DownloaderError> ChunkWorker::run(const ChunkTask& task)
    {
        m_attempts = 0;
        m_received = 0;

        int failures = 0;
        DownloaderError last{ ErrorLevel::SERIOUS, ErrorCode::PF_UNKNOWN, "no attempt was made" };

        while (true)
        {
            if (auto stop = stop_reason(task))
            {
                return tl::unexpected(stop.value());
            }

            if (failures > 0 && m_policy.delay.count() > 0)
            {
                if (m_token.wait_for(m_policy.delay * failures))
                {
                    continue;
                }
            }

            ++m_attempts;
            auto res = attempt(task);
            if (res)
            {
                spdlog::debug("[job {}] chunk {} done after {} attempt(s)",
                              task.job_id,
                              task.index,
                              m_attempts);
                return res;
            }

            last = res.error();
            const bool interrupted = last.code == ErrorCode::PF_CANCELLED
                                     || last.code == ErrorCode::PF_TIMEOUT;
            if (interrupted && m_token.should_stop())
            {
                // the top of the loop reports the token state
                continue;
            }

            ++failures;
            if (failures > m_policy.max_retries)
            {
                break;
            }
            spdlog::warn("[job {}] chunk {} attempt {} failed, retrying: {}",
                         task.job_id,
                         task.index,
                         m_attempts,
                         last.message());
        }

        spdlog::error("[job {}] chunk {} failed after {} attempt(s): {}",
                      task.job_id,
                      task.index,
                      m_attempts,
                      last.message());
        m_token.trip(last);
        return tl::unexpected(last);
    }

    tl::expected<void, DownloaderError> ChunkWorker::attempt(const ChunkTask& task)
    {
        std::uint64_t received = 0;
        std::optional<DownloaderError> rejected;
        const std::uint64_t offset = task.ranged ? task.range.start : 0;
        const std::uint64_t expected = task.ranged ? task.range.size() : task.expected_size;

        FetchRequest request;
        request.url = task.url;
        request.cookies = task.cookies;
        request.timeout = m_token.remaining();
        if (task.ranged)
        {
            request.range = task.range;
        }

        FetchHandlers handlers;
        handlers.on_response = [&](const Response& response)
        {
            if (task.ranged)
            {
                if (response.http_status != 206)
                {
                    rejected = DownloaderError{
                        ErrorLevel::SERIOUS,
                        ErrorCode::PF_RANGE_NOT_HONORED,
                        fmt::format("Expected HTTP 206 for bytes {} of {}, got {}",
                                    to_range_spec(task.range),
                                    task.url,
                                    response.http_status) };
                    return false;
                }
            }
            else if (auto error = classify_status(response.http_status, task.url))
            {
                rejected = error;
                return false;
            }
            return true;
        };
        handlers.on_data = [&](const char* data, std::size_t size)
        {
            if (task.ranged && received + size > expected)
            {
                rejected = DownloaderError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::PF_RANGE_NOT_HONORED,
                    fmt::format("Server sent more than the {} bytes of range {}",
                                expected,
                                to_range_spec(task.range)) };
                return false;
            }
            auto written = m_sink.write_at(offset + received, data, size);
            if (!written)
            {
                rejected = written.error();
                return false;
            }
            received += size;
            return true;
        };
        handlers.should_abort = [&]() { return m_token.should_stop(); };

        auto response = m_transport.fetch(request, handlers);
        m_received = received;

        if (rejected)
        {
            return tl::unexpected(rejected.value());
        }
        if (!response)
        {
            return tl::unexpected(response.error());
        }
        if (expected > 0 && received != expected)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::SERIOUS,
                ErrorCode::PF_TRANSPORT,
                fmt::format("Short transfer for chunk {}: {} of {} bytes", task.index, received, expected) });
        }
        return {};
    }
}

#ifndef PARAFETCH_CANCELLATION_HPP
#define PARAFETCH_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include <parafetch/export.hpp>
#include <parafetch/errors.hpp>

namespace parafetch
{
    // Shared stop signal of one job. It is tripped at most once: the first
    // caller of `trip()` records the error every worker ends up reporting.
    // An optional deadline makes the token expire on its own.
    class PARAFETCH_API CancellationToken
    {
    public:
        using clock = std::chrono::steady_clock;

        CancellationToken() = default;
        explicit CancellationToken(clock::time_point deadline);

        CancellationToken(const CancellationToken&) = delete;
        CancellationToken& operator=(const CancellationToken&) = delete;

        // Returns true when this call tripped the token.
        bool trip(DownloaderError error);

        bool is_tripped() const noexcept;
        std::optional<DownloaderError> error() const;

        bool has_deadline() const noexcept;
        bool expired() const noexcept;
        // Time left before the deadline, zero once it passed.
        // `std::nullopt` when the token has no deadline.
        std::optional<std::chrono::milliseconds> remaining() const noexcept;

        // Trips with PF_TIMEOUT when the deadline has passed.
        // Returns true when the token is tripped afterwards.
        bool check_deadline();

        bool should_stop() const noexcept
        {
            return is_tripped() || expired();
        }

        // Sleeps up to `duration`, waking early when the token is tripped or the
        // deadline passes. Returns true when the caller should stop.
        bool wait_for(std::chrono::milliseconds duration);

    private:
        std::atomic<bool> m_tripped{ false };
        std::optional<clock::time_point> m_deadline;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::optional<DownloaderError> m_error;
    };
}

#endif

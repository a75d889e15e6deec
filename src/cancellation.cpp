#include <algorithm>

#include <spdlog/spdlog.h>

#include <parafetch/cancellation.hpp>

namespace parafetch
{
    CancellationToken::CancellationToken(clock::time_point deadline)
        : m_deadline(deadline)
    {
    }

    bool CancellationToken::trip(DownloaderError error)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_tripped.load())
            {
                return false;
            }
            m_error = std::move(error);
            m_tripped.store(true);
        }
        spdlog::debug("Cancellation requested: {}", m_error->reason);
        m_cv.notify_all();
        return true;
    }

    bool CancellationToken::is_tripped() const noexcept
    {
        return m_tripped.load();
    }

    std::optional<DownloaderError> CancellationToken::error() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_error;
    }

    bool CancellationToken::has_deadline() const noexcept
    {
        return m_deadline.has_value();
    }

    bool CancellationToken::expired() const noexcept
    {
        return m_deadline && clock::now() >= *m_deadline;
    }

    std::optional<std::chrono::milliseconds> CancellationToken::remaining() const noexcept
    {
        if (!m_deadline)
        {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*m_deadline
                                                                          - clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    bool CancellationToken::check_deadline()
    {
        if (expired())
        {
            trip(DownloaderError{
                ErrorLevel::SERIOUS, ErrorCode::PF_TIMEOUT, "Deadline of the transfer exceeded" });
        }
        return is_tripped();
    }

    bool CancellationToken::wait_for(std::chrono::milliseconds duration)
    {
        auto until = clock::now() + duration;
        if (m_deadline && *m_deadline < until)
        {
            until = *m_deadline;
        }
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_until(lock, until, [this] { return m_tripped.load(); });
        lock.unlock();
        return should_stop();
    }
}

#ifndef PARAFETCH_ERRORS_HPP
#define PARAFETCH_ERRORS_HPP

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include <parafetch/export.hpp>
#include <parafetch/enums.hpp>

namespace parafetch
{
    PARAFETCH_API const char* to_string(ErrorCode code) noexcept;
    PARAFETCH_API const char* to_string(JobState state) noexcept;

    struct DownloaderError
    {
        ErrorLevel level;
        ErrorCode code;
        std::string reason;

        std::string message() const
        {
            return fmt::format("{}: {}", to_string(code), reason);
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(message());
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(message());
                    break;
                default:
                    spdlog::warn(message());
            }
        }
    };

    class PARAFETCH_API download_error : public std::runtime_error
    {
    public:
        explicit download_error(DownloaderError error)
            : std::runtime_error(error.message())
            , m_error(std::move(error))
        {
        }

        const DownloaderError& error() const noexcept
        {
            return m_error;
        }

    private:
        DownloaderError m_error;
    };
}

#endif

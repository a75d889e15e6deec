#include <parafetch/errors.hpp>
#include <parafetch/parafetch.hpp>

namespace parafetch
{
    const char* version()
    {
        return "0.1.0";
    }

    const char* to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::PF_OK:
                return "ok";
            case ErrorCode::PF_INVALID_LOCATOR:
                return "invalid locator";
            case ErrorCode::PF_NOT_FOUND:
                return "not found";
            case ErrorCode::PF_UNAUTHORIZED:
                return "unauthorized";
            case ErrorCode::PF_TRANSPORT:
                return "transport error";
            case ErrorCode::PF_RANGE_NOT_HONORED:
                return "range not honored";
            case ErrorCode::PF_IO:
                return "io error";
            case ErrorCode::PF_INVALID_FILENAME:
                return "invalid file name";
            case ErrorCode::PF_TIMEOUT:
                return "timeout";
            case ErrorCode::PF_CANCELLED:
                return "cancelled";
            default:
                return "unknown error";
        }
    }

    const char* to_string(JobState state) noexcept
    {
        switch (state)
        {
            case JobState::kCREATED:
                return "created";
            case JobState::kPROBING:
                return "probing";
            case JobState::kAWAITING_DESTINATION:
                return "awaiting destination";
            case JobState::kFETCHING:
                return "fetching";
            case JobState::kSUCCEEDED:
                return "succeeded";
            case JobState::kFAILED:
                return "failed";
            case JobState::kCANCELLED:
                return "cancelled";
        }
        return "unknown";
    }
}

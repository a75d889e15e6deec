#ifndef PARAFETCH_ENUMS_HPP
#define PARAFETCH_ENUMS_HPP

namespace parafetch
{
    enum class Protocol
    {
        kOTHER,
        kHTTP,
        kFTP,
    };

    enum class JobState
    {
        // The job was issued by a Downloader and nothing has been requested yet.
        kCREATED,
        // The metadata request is running.
        kPROBING,
        // Waiting for the destination chooser (or resolving the target path).
        kAWAITING_DESTINATION,
        // Chunk workers are transferring the payload.
        kFETCHING,
        // The destination file holds the complete payload.
        kSUCCEEDED,
        // The job stopped with an error.
        kFAILED,
        // The destination chooser was declined.
        kCANCELLED,
    };

    // Non-error outcome of a job.
    enum class JobStatus
    {
        kSUCCEEDED,
        kCANCELLED,
    };

    /** Return/error codes */
    enum class ErrorCode
    {
        // everything is ok
        PF_OK,
        // the resource locator could not be parsed or uses an unsupported scheme
        PF_INVALID_LOCATOR,
        // the server reported the resource as missing
        PF_NOT_FOUND,
        // the server (or FTP login) refused access
        PF_UNAUTHORIZED,
        // connection, protocol or unexpected status failure
        PF_TRANSPORT,
        // a ranged request was not answered with partial content
        PF_RANGE_NOT_HONORED,
        // local file operation error
        PF_IO,
        // the resolved file name is empty or has no extension separator
        PF_INVALID_FILENAME,
        // the job deadline passed
        PF_TIMEOUT,
        // the transfer was stopped by the cancellation signal
        PF_CANCELLED,
        // (xx) unknown error - sentinel of error codes enum
        PF_UNKNOWN,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };
}

#endif

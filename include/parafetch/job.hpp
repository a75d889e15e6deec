#ifndef PARAFETCH_JOB_HPP
#define PARAFETCH_JOB_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/destination.hpp>
#include <parafetch/enums.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/ftp.hpp>
#include <parafetch/options.hpp>
#include <parafetch/range_planner.hpp>
#include <parafetch/transport.hpp>
#include <parafetch/url.hpp>

namespace parafetch
{
    class CancellationToken;
    class WriteCoordinator;

    // One transfer attempt. A job runs once: `download()` (or `download_single()`)
    // moves it from kCREATED to a terminal state and it is never reused.
    class PARAFETCH_API Job
    {
    public:
        Job(std::size_t id,
            URLHandler url,
            Options options,
            std::shared_ptr<Transport> transport,
            std::shared_ptr<FtpClient> ftp_client,
            std::shared_ptr<DestinationChooser> chooser = nullptr);

        Job(const Job&) = delete;
        Job& operator=(const Job&) = delete;

        // Probe, choose the destination, plan the ranges and fetch them in
        // parallel. ftp:// locators are retrieved as one stream instead.
        tl::expected<JobStatus, DownloaderError> download();

        // One plain request without probing: the name comes from the response
        // and a compressed body is decoded while it is written.
        tl::expected<JobStatus, DownloaderError> download_single();

        std::size_t id() const noexcept;
        const URLHandler& url() const noexcept;
        bool is_ftp() const noexcept;
        JobState state() const noexcept;

        const Options& options() const noexcept;
        // Only meaningful before the job runs, e.g. from an after-create hook.
        Options& options() noexcept;

        const std::string& file_name() const noexcept;
        void set_file_name(const std::string& file_name);
        std::uint64_t file_size() const noexcept;
        bool supports_range() const noexcept;
        const RangePlan& plan() const noexcept;

        // Where the payload is written: the file name itself when absolute,
        // otherwise dir / (prefix + file name).
        fs::path target_file() const;

    private:
        tl::expected<JobStatus, DownloaderError> download_http();
        tl::expected<JobStatus, DownloaderError> download_ftp();

        // false when the chooser was declined
        bool resolve_destination();
        tl::expected<void, DownloaderError> check_file_name() const;
        tl::expected<void, DownloaderError> begin();
        tl::expected<void, DownloaderError> run_workers(WriteCoordinator& sink,
                                                        CancellationToken& token);

        std::optional<std::chrono::milliseconds> timeout_budget() const;
        std::unique_ptr<CancellationToken> make_token() const;

        void set_state(JobState state);
        tl::expected<JobStatus, DownloaderError> fail(DownloaderError error);
        JobStatus finish(JobStatus status);

        std::size_t m_id;
        URLHandler m_url;
        Options m_options;

        std::shared_ptr<Transport> m_transport;
        std::shared_ptr<FtpClient> m_ftp_client;
        std::shared_ptr<DestinationChooser> m_chooser;

        std::atomic<bool> m_started{ false };
        std::atomic<JobState> m_state{ JobState::kCREATED };
        std::string m_file_name;
        std::uint64_t m_file_size = 0;
        bool m_supports_range = false;
        RangePlan m_plan;
    };
}

#endif

#ifndef PARAFETCH_DOWNLOADER_HPP
#define PARAFETCH_DOWNLOADER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/destination.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/ftp.hpp>
#include <parafetch/job.hpp>
#include <parafetch/options.hpp>
#include <parafetch/transport.hpp>

namespace parafetch
{
    class Context;

    // Issues jobs. Every job gets a copy of the options (the defaults, or the
    // ones passed to `new_job`) and an identifier that grows by one per job.
    class PARAFETCH_API Downloader
    {
    public:
        using after_create_callback_type = std::function<void(Job&)>;

        // Uses libcurl for HTTP(S) and FTP.
        explicit Downloader(const Context& ctx, Options defaults = {});
        Downloader(std::shared_ptr<Transport> transport,
                   std::shared_ptr<FtpClient> ftp_client,
                   Options defaults = {});

        // Fails with PF_INVALID_LOCATOR; no identifier is used up in that case.
        tl::expected<std::unique_ptr<Job>, DownloaderError> new_job(
            const std::string& url, const std::optional<Options>& options = std::nullopt);

        // new_job() followed by Job::download().
        tl::expected<JobStatus, DownloaderError> download(
            const std::string& url, const std::optional<Options>& options = std::nullopt);

        // new_job() followed by Job::download_single().
        tl::expected<JobStatus, DownloaderError> download_file(
            const std::string& url, const std::optional<Options>& options = std::nullopt);

        // Runs synchronously inside new_job(), once per job, never concurrently
        // with itself.
        void set_after_create_job(after_create_callback_type callback);
        void set_destination_chooser(std::shared_ptr<DestinationChooser> chooser);

        const Options& default_options() const noexcept;

    private:
        Options m_defaults;
        std::shared_ptr<Transport> m_transport;
        std::shared_ptr<FtpClient> m_ftp_client;
        std::shared_ptr<DestinationChooser> m_chooser;

        std::mutex m_id_mutex;
        std::size_t m_last_job_id = 0;

        // guards m_chooser and m_after_create
        std::mutex m_hook_mutex;
        after_create_callback_type m_after_create;
    };
}

#endif

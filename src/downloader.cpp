#include <spdlog/spdlog.h>

#include <parafetch/downloader.hpp>
#include <parafetch/url.hpp>

namespace parafetch
{
    Downloader::Downloader(const Context& ctx, Options defaults)
        : Downloader(std::make_shared<CurlTransport>(ctx),
                     std::make_shared<CurlFtpClient>(ctx),
                     std::move(defaults))
    {
    }

    Downloader::Downloader(std::shared_ptr<Transport> transport,
                           std::shared_ptr<FtpClient> ftp_client,
                           Options defaults)
        : m_defaults(std::move(defaults))
        , m_transport(std::move(transport))
        , m_ftp_client(std::move(ftp_client))
    {
    }

    tl::expected<std::unique_ptr<Job>, DownloaderError> Downloader::new_job(
        const std::string& url, const std::optional<Options>& options)
    {
        auto handler = URLHandler::parse(url);
        if (!handler)
        {
            return tl::unexpected(handler.error());
        }

        std::size_t id;
        {
            std::lock_guard<std::mutex> lock(m_id_mutex);
            id = ++m_last_job_id;
        }

        std::lock_guard<std::mutex> lock(m_hook_mutex);
        auto job = std::make_unique<Job>(id,
                                         std::move(handler.value()),
                                         options ? options.value() : m_defaults,
                                         m_transport,
                                         m_ftp_client,
                                         m_chooser);
        spdlog::debug("[job {}] created for {}", id, url);

        if (m_after_create)
        {
            m_after_create(*job);
        }
        return std::move(job);
    }

    tl::expected<JobStatus, DownloaderError> Downloader::download(
        const std::string& url, const std::optional<Options>& options)
    {
        auto job = new_job(url, options);
        if (!job)
        {
            return tl::unexpected(job.error());
        }
        return job.value()->download();
    }

    tl::expected<JobStatus, DownloaderError> Downloader::download_file(
        const std::string& url, const std::optional<Options>& options)
    {
        auto job = new_job(url, options);
        if (!job)
        {
            return tl::unexpected(job.error());
        }
        return job.value()->download_single();
    }

    void Downloader::set_after_create_job(after_create_callback_type callback)
    {
        std::lock_guard<std::mutex> lock(m_hook_mutex);
        m_after_create = std::move(callback);
    }

    void Downloader::set_destination_chooser(std::shared_ptr<DestinationChooser> chooser)
    {
        std::lock_guard<std::mutex> lock(m_hook_mutex);
        m_chooser = std::move(chooser);
    }

    const Options& Downloader::default_options() const noexcept
    {
        return m_defaults;
    }
}

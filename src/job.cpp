#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <parafetch/cancellation.hpp>
#include <parafetch/chunk_worker.hpp>
#include <parafetch/job.hpp>
#include <parafetch/probe.hpp>
#include <parafetch/utils.hpp>
#include <parafetch/write_coordinator.hpp>

namespace parafetch
{
    Job::Job(std::size_t id,
             URLHandler url,
             Options options,
             std::shared_ptr<Transport> transport,
             std::shared_ptr<FtpClient> ftp_client,
             std::shared_ptr<DestinationChooser> chooser)
        : m_id(id)
        , m_url(std::move(url))
        , m_options(std::move(options))
        , m_transport(std::move(transport))
        , m_ftp_client(std::move(ftp_client))
        , m_chooser(std::move(chooser))
    {
        if (!m_transport || !m_ftp_client)
        {
            throw std::invalid_argument("Job needs a transport and an FTP client");
        }
    }

    std::size_t Job::id() const noexcept
    {
        return m_id;
    }

    const URLHandler& Job::url() const noexcept
    {
        return m_url;
    }

    bool Job::is_ftp() const noexcept
    {
        return m_url.protocol() == Protocol::kFTP;
    }

    JobState Job::state() const noexcept
    {
        return m_state.load();
    }

    const Options& Job::options() const noexcept
    {
        return m_options;
    }

    Options& Job::options() noexcept
    {
        return m_options;
    }

    const std::string& Job::file_name() const noexcept
    {
        return m_file_name;
    }

    void Job::set_file_name(const std::string& file_name)
    {
        m_file_name = file_name;
    }

    std::uint64_t Job::file_size() const noexcept
    {
        return m_file_size;
    }

    bool Job::supports_range() const noexcept
    {
        return m_supports_range;
    }

    const RangePlan& Job::plan() const noexcept
    {
        return m_plan;
    }

    fs::path Job::target_file() const
    {
        return target_path(m_options.dir, m_options.file_name_prefix, m_file_name);
    }

    void Job::set_state(JobState state)
    {
        spdlog::debug("[job {}] {} -> {}", m_id, to_string(m_state.load()), to_string(state));
        m_state = state;
    }

    tl::expected<JobStatus, DownloaderError> Job::fail(DownloaderError error)
    {
        set_state(JobState::kFAILED);
        spdlog::error("[job {}] {}", m_id, error.message());
        return tl::unexpected(std::move(error));
    }

    JobStatus Job::finish(JobStatus status)
    {
        if (status == JobStatus::kCANCELLED)
        {
            set_state(JobState::kCANCELLED);
            spdlog::info("[job {}] destination declined, nothing was transferred", m_id);
        }
        else
        {
            set_state(JobState::kSUCCEEDED);
            spdlog::info("[job {}] finished {}", m_id, target_file().string());
        }
        return status;
    }

    std::optional<std::chrono::milliseconds> Job::timeout_budget() const
    {
        if (m_options.timeout.count() > 0)
        {
            return m_options.timeout;
        }
        return std::nullopt;
    }

    std::unique_ptr<CancellationToken> Job::make_token() const
    {
        if (auto budget = timeout_budget())
        {
            return std::make_unique<CancellationToken>(CancellationToken::clock::now()
                                                       + budget.value());
        }
        return std::make_unique<CancellationToken>();
    }

    tl::expected<void, DownloaderError> Job::begin()
    {
        if (m_started.exchange(true))
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::PF_UNKNOWN,
                fmt::format("[job {}] already ran (state {})", m_id, to_string(state())) });
        }
        return {};
    }

    bool Job::resolve_destination()
    {
        if (!m_options.use_destination_chooser || !m_chooser)
        {
            return true;
        }

        auto chosen = m_chooser->choose_save_location(target_file());
        if (!chosen)
        {
            return false;
        }
        // the chosen path is taken verbatim, without prefix
        m_options.dir = chosen->parent_path();
        m_options.file_name_prefix.clear();
        m_file_name = chosen->filename().string();
        spdlog::debug("[job {}] destination chosen: {}", m_id, chosen->string());
        return true;
    }

    tl::expected<void, DownloaderError> Job::check_file_name() const
    {
        if (!is_valid_file_name(fs::path(m_file_name).filename().string()))
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::SERIOUS,
                ErrorCode::PF_INVALID_FILENAME,
                fmt::format("'{}' is not a usable file name", m_file_name) });
        }
        return {};
    }

    tl::expected<JobStatus, DownloaderError> Job::download()
    {
        if (auto ok = begin(); !ok)
        {
            return tl::unexpected(ok.error());
        }

        spdlog::info("[job {}] starting {}", m_id, m_url.url());
        if (is_ftp())
        {
            return download_ftp();
        }
        return download_http();
    }

    tl::expected<JobStatus, DownloaderError> Job::download_http()
    {
        set_state(JobState::kPROBING);
        auto probe = probe_resource(*m_transport, m_url, m_options.cookies, timeout_budget());
        if (!probe)
        {
            return fail(probe.error());
        }
        m_file_size = probe->total_size;
        m_supports_range = probe->supports_range;
        m_file_name = probe->suggested_file_name;

        set_state(JobState::kAWAITING_DESTINATION);
        if (!resolve_destination())
        {
            return finish(JobStatus::kCANCELLED);
        }
        if (auto valid = check_file_name(); !valid)
        {
            return fail(valid.error());
        }

        set_state(JobState::kFETCHING);
        m_plan = plan_ranges(
            m_file_size, m_options.min_chunk_size, m_options.max_workers, m_supports_range);
        spdlog::info("[job {}] {} in {} chunk(s), {}",
                     m_id,
                     m_file_size > 0 ? format_size(m_file_size) : std::string("unknown size"),
                     m_plan.worker_count,
                     m_plan.ranged ? "ranged" : "single stream");

        auto token = make_token();

        auto target = create_target_file(
            m_options.dir, m_options.file_name_prefix, m_file_name, m_options.overwrite);
        if (!target)
        {
            return fail(target.error());
        }
        m_file_name = target->file_name;

        WriteCoordinator sink(std::move(target->file));
        if (m_file_size > 0)
        {
            if (auto resized = sink.resize(m_file_size); !resized)
            {
                return fail(resized.error());
            }
        }

        auto fetched = run_workers(sink, *token);
        auto closed = sink.close();
        if (!fetched)
        {
            return fail(fetched.error());
        }
        if (!closed)
        {
            return fail(closed.error());
        }
        return finish(JobStatus::kSUCCEEDED);
    }

    tl::expected<void, DownloaderError> Job::run_workers(WriteCoordinator& sink,
                                                         CancellationToken& token)
    {
        std::vector<ChunkTask> tasks;
        if (m_plan.ranged)
        {
            for (std::size_t i = 0; i < m_plan.ranges.size(); ++i)
            {
                ChunkTask task;
                task.range = m_plan.ranges[i];
                task.index = i;
                task.ranged = true;
                tasks.push_back(std::move(task));
            }
        }
        else
        {
            ChunkTask task;
            task.ranged = false;
            task.expected_size = m_file_size;
            if (!m_plan.ranges.empty())
            {
                task.range = m_plan.ranges.front();
            }
            tasks.push_back(std::move(task));
        }
        for (auto& task : tasks)
        {
            task.job_id = m_id;
            task.url = m_url.url();
            task.cookies = m_options.cookies;
        }

        const RetryPolicy policy{ m_options.max_retries, m_options.retry_delay };
        std::vector<tl::expected<void, DownloaderError>> results(tasks.size());
        std::vector<std::thread> workers;
        workers.reserve(tasks.size());

        for (std::size_t i = 0; i < tasks.size(); ++i)
        {
            try
            {
                workers.emplace_back(
                    [&, i]()
                    {
                        try
                        {
                            ChunkWorker worker(*m_transport, sink, token, policy);
                            results[i] = worker.run(tasks[i]);
                        }
                        catch (const std::exception& e)
                        {
                            DownloaderError error{ ErrorLevel::SERIOUS,
                                                   ErrorCode::PF_TRANSPORT,
                                                   fmt::format("chunk {} aborted: {}", i, e.what()) };
                            token.trip(error);
                            results[i] = tl::unexpected(error);
                        }
                    });
            }
            catch (const std::system_error& e)
            {
                token.trip(DownloaderError{ ErrorLevel::FATAL,
                                            ErrorCode::PF_IO,
                                            fmt::format("Could not start worker {}: {}", i, e.what()) });
                break;
            }
        }

        // no result is looked at before every worker returned
        for (auto& worker : workers)
        {
            worker.join();
        }

        if (auto error = token.error())
        {
            return tl::unexpected(error.value());
        }
        for (auto& result : results)
        {
            if (!result)
            {
                return tl::unexpected(result.error());
            }
        }
        spdlog::debug("[job {}] {} bytes written", m_id, sink.bytes_written());
        return {};
    }

    tl::expected<JobStatus, DownloaderError> Job::download_ftp()
    {
        m_file_name = m_url.file_name();

        set_state(JobState::kAWAITING_DESTINATION);
        if (!resolve_destination())
        {
            return finish(JobStatus::kCANCELLED);
        }
        if (auto valid = check_file_name(); !valid)
        {
            return fail(valid.error());
        }

        set_state(JobState::kFETCHING);
        auto token = make_token();

        FtpRequest request;
        request.host = m_url.host();
        request.port = m_url.port();
        request.user = m_url.user().empty() ? std::string("anonymous") : m_url.user();
        request.password = m_url.password();
        request.path = m_url.path();
        request.timeout = token->remaining();

        // the file is created with the first byte, a failed login leaves nothing behind
        std::unique_ptr<WriteCoordinator> sink;
        std::optional<DownloaderError> sink_error;
        std::uint64_t offset = 0;

        auto open_sink = [&]() -> bool
        {
            auto target = create_target_file(
                m_options.dir, m_options.file_name_prefix, m_file_name, m_options.overwrite);
            if (!target)
            {
                sink_error = target.error();
                return false;
            }
            m_file_name = target->file_name;
            sink = std::make_unique<WriteCoordinator>(std::move(target->file));
            return true;
        };

        auto retrieved = m_ftp_client->retrieve(
            request,
            [&](const char* data, std::size_t size)
            {
                if (!sink && !open_sink())
                {
                    return false;
                }
                auto written = sink->write_at(offset, data, size);
                if (!written)
                {
                    sink_error = written.error();
                    return false;
                }
                offset += size;
                return true;
            },
            [&]() { return token->should_stop(); });

        if (sink_error)
        {
            return fail(sink_error.value());
        }
        if (!retrieved)
        {
            if (token->check_deadline())
            {
                return fail(token->error().value());
            }
            return fail(retrieved.error());
        }
        if (!sink && !open_sink())
        {
            return fail(sink_error.value());
        }
        if (auto closed = sink->close(); !closed)
        {
            return fail(closed.error());
        }
        m_file_size = offset;
        return finish(JobStatus::kSUCCEEDED);
    }

    tl::expected<JobStatus, DownloaderError> Job::download_single()
    {
        if (auto ok = begin(); !ok)
        {
            return tl::unexpected(ok.error());
        }
        if (is_ftp())
        {
            return download_ftp();
        }

        spdlog::info("[job {}] fetching {} in one request", m_id, m_url.url());
        set_state(JobState::kFETCHING);
        auto token = make_token();

        std::unique_ptr<WriteCoordinator> sink;
        std::optional<DownloaderError> rejected;
        bool declined = false;
        std::uint64_t offset = 0;

        FetchRequest request;
        request.url = m_url.url();
        request.cookies = m_options.cookies;
        // no request timeout, the token is polled through should_abort
        request.decode_content = true;

        FetchHandlers handlers;
        handlers.on_response = [&](const Response& response)
        {
            if (auto error = classify_status(response.http_status, request.url))
            {
                rejected = error;
                return false;
            }
            m_file_name = file_name_from_response(response, m_url);

            // the deadline is paused while the destination is chosen
            auto left = token->remaining();
            set_state(JobState::kAWAITING_DESTINATION);
            if (!resolve_destination())
            {
                declined = true;
                return false;
            }
            if (left)
            {
                token = std::make_unique<CancellationToken>(CancellationToken::clock::now()
                                                            + left.value());
            }
            if (auto valid = check_file_name(); !valid)
            {
                rejected = valid.error();
                return false;
            }

            auto target = create_target_file(
                m_options.dir, m_options.file_name_prefix, m_file_name, m_options.overwrite);
            if (!target)
            {
                rejected = target.error();
                return false;
            }
            m_file_name = target->file_name;
            sink = std::make_unique<WriteCoordinator>(std::move(target->file));
            set_state(JobState::kFETCHING);
            return true;
        };
        handlers.on_data = [&](const char* data, std::size_t size)
        {
            auto written = sink->write_at(offset, data, size);
            if (!written)
            {
                rejected = written.error();
                return false;
            }
            offset += size;
            return true;
        };
        handlers.should_abort = [&]() { return token->should_stop(); };

        auto response = m_transport->fetch(request, handlers);

        if (declined)
        {
            return finish(JobStatus::kCANCELLED);
        }
        if (rejected)
        {
            return fail(rejected.value());
        }
        if (!response)
        {
            if (token->check_deadline())
            {
                return fail(token->error().value());
            }
            return fail(response.error());
        }
        if (!sink)
        {
            return fail(DownloaderError{ ErrorLevel::SERIOUS,
                                         ErrorCode::PF_TRANSPORT,
                                         fmt::format("No response received for {}", request.url) });
        }
        if (auto closed = sink->close(); !closed)
        {
            return fail(closed.error());
        }
        m_file_size = offset;
        return finish(JobStatus::kSUCCEEDED);
    }
}

#include <iostream>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <parafetch/context.hpp>
#include <parafetch/downloader.hpp>
#include <parafetch/parafetch.hpp>
#include <parafetch/probe.hpp>
#include <parafetch/url.hpp>
#include <parafetch/utils.hpp>

#include "config.hpp"

using namespace parafetch;

// Keeps the suggested directory and replaces the file name.
class FixedNameChooser : public DestinationChooser
{
public:
    explicit FixedNameChooser(std::string name)
        : m_name(std::move(name))
    {
    }

    std::optional<fs::path> choose_save_location(const fs::path& suggested) override
    {
        if (fs::path(m_name).is_absolute())
        {
            return fs::path(m_name);
        }
        return suggested.parent_path() / m_name;
    }

private:
    std::string m_name;
};

struct DownloadFlags
{
    std::string outfile;
    bool ask = false;
    bool single = false;
};

int
handle_download(Context& ctx, cli::CliConfig& config, const DownloadFlags& flags)
{
    if (config.targets.empty())
    {
        spdlog::error("Nothing to download");
        return 1;
    }
    if (!flags.outfile.empty() && config.targets.size() > 1)
    {
        spdlog::error("-o can only be used with a single target");
        return 1;
    }

    Downloader dl{ ctx, config.options };
    if (!flags.outfile.empty())
    {
        dl.set_destination_chooser(std::make_shared<FixedNameChooser>(flags.outfile));
    }
    else if (flags.ask)
    {
        dl.set_destination_chooser(std::make_shared<cli::TerminalChooser>(std::cin, std::cout));
    }
    dl.set_after_create_job([](Job& job)
                            { spdlog::debug("[job {}] queued {}", job.id(), job.url().url()); });

    int failures = 0;
    for (auto& target : config.targets)
    {
        auto job = dl.new_job(target);
        if (!job)
        {
            job.error().log();
            ++failures;
            continue;
        }

        auto result = flags.single ? job.value()->download_single() : job.value()->download();

        if (!result)
        {
            std::cerr << "Download of " << target << " failed: " << result.error().message()
                      << std::endl;
            ++failures;
        }
        else if (result.value() == JobStatus::kCANCELLED)
        {
            std::cout << "Download of " << target << " cancelled" << std::endl;
        }
        else
        {
            std::cout << "Downloaded " << target << " to " << job.value()->target_file().string()
                      << std::endl;
        }
    }
    return failures == 0 ? 0 : 1;
}

int
handle_info(Context& ctx, const cli::CliConfig& config, bool as_json)
{
    CurlTransport transport{ ctx };
    int failures = 0;
    nlohmann::json all = nlohmann::json::array();

    for (auto& target : config.targets)
    {
        auto url = URLHandler::parse(target);
        if (!url)
        {
            url.error().log();
            ++failures;
            continue;
        }
        auto probe = probe_resource(transport, url.value(), config.options.cookies,
                                    config.options.timeout.count() > 0
                                        ? std::optional(config.options.timeout)
                                        : std::nullopt);
        if (!probe)
        {
            probe.error().log();
            ++failures;
            continue;
        }

        if (as_json)
        {
            nlohmann::json j = to_json(probe.value());
            j["url"] = target;
            all.push_back(j);
        }
        else
        {
            std::cout << target << "\n"
                      << "  name:   " << probe->suggested_file_name << "\n"
                      << "  size:   "
                      << (probe->total_size > 0 ? format_size(probe->total_size) : "unknown")
                      << "\n"
                      << "  ranges: " << (probe->supports_range ? "yes" : "no") << std::endl;
        }
    }

    if (as_json)
    {
        std::cout << all.dump(2) << std::endl;
    }
    return failures == 0 ? 0 : 1;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "parafetch: multi-connection downloader" };
    app.require_subcommand(1);

    std::vector<std::string> targets;
    std::vector<std::string> cookies;
    std::string file, outdir, prefix;
    int verbosity = 0;
    bool disable_ssl = false;
    bool overwrite = false;
    bool as_json = false;
    std::size_t workers = 0;
    std::int64_t min_chunk = 0;
    double timeout = -1;
    DownloadFlags flags;

    CLI::App* s_dl = app.add_subcommand("download", "Download files");
    s_dl->add_option("targets", targets, "URLs to download");
    s_dl->add_option("-f", file, "YAML file with targets and options");
    s_dl->add_option("-d", outdir, "Output directory");
    s_dl->add_option("-o", flags.outfile, "Output file name");
    s_dl->add_option("-p,--prefix", prefix, "Prefix added to the file name");
    s_dl->add_option("-n,--workers", workers, "Maximum number of parallel connections");
    s_dl->add_option("--min-chunk", min_chunk, "Minimum chunk size in bytes");
    s_dl->add_option("-t,--timeout", timeout, "Timeout of the whole transfer in seconds");
    s_dl->add_option("-c,--cookie", cookies, "Cookie sent with every request (name=value)");
    s_dl->add_flag("--overwrite", overwrite, "Replace existing files");
    s_dl->add_flag("--ask", flags.ask, "Ask for the destination of every file");
    s_dl->add_flag("--single", flags.single, "Use one plain request per file");

    CLI::App* s_info = app.add_subcommand("info", "Show what the server reports about files");
    s_info->add_option("targets", targets, "URLs to inspect");
    s_info->add_option("-f", file, "YAML file with targets and options");
    s_info->add_option("-c,--cookie", cookies, "Cookie sent with every request (name=value)");
    s_info->add_flag("--json", as_json, "Print JSON");

    for (auto* sub : { s_dl, s_info })
    {
        sub->add_flag("-v", verbosity, "Increase verbosity");
        sub->add_flag("-k", disable_ssl, "Disable SSL verification");
    }
    app.add_flag_callback(
        "--version",
        []()
        {
            std::cout << parafetch::version() << std::endl;
            throw CLI::Success();
        },
        "Print the version");

    CLI11_PARSE(app, argc, argv);

    parafetch::Context ctx;
    ctx.set_verbosity(verbosity);
    ctx.disable_ssl = disable_ssl;

    cli::CliConfig config;
    config.options.use_destination_chooser = true;
    try
    {
        if (!file.empty())
        {
            cli::load_config_file(file, config);
        }
        for (auto& c : cookies)
        {
            config.options.cookies.push_back(cli::parse_cookie(c));
        }
    }
    catch (const YAML::Exception& e)
    {
        spdlog::critical("Could not read {}: {}", file, e.what());
        return 1;
    }
    catch (const std::invalid_argument& e)
    {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    config.targets.insert(config.targets.end(), targets.begin(), targets.end());
    ctx.proxy_map.insert(config.proxies.begin(), config.proxies.end());
    ctx.additional_httpheaders = config.headers;

    if (!outdir.empty())
        config.options.dir = outdir;
    if (!prefix.empty())
        config.options.file_name_prefix = prefix;
    if (workers > 0)
        config.options.max_workers = workers;
    if (min_chunk > 0)
        config.options.min_chunk_size = min_chunk;
    if (timeout >= 0)
        config.options.timeout
            = std::chrono::milliseconds(static_cast<std::int64_t>(timeout * 1000));
    if (overwrite)
        config.options.overwrite = true;

    if (app.got_subcommand(s_info))
    {
        return handle_info(ctx, config, as_json);
    }
    return handle_download(ctx, config, flags);
}

#include <stdexcept>

#include <spdlog/spdlog.h>

#include <parafetch/utils.hpp>

#include "config.hpp"

namespace parafetch::cli
{
    void load_config(const YAML::Node& node, CliConfig& config)
    {
        if (!node.IsMap())
        {
            throw std::invalid_argument("configuration root must be a map");
        }

        if (node["targets"])
        {
            config.targets = node["targets"].as<std::vector<std::string>>();
        }
        if (node["dir"])
        {
            config.options.dir = node["dir"].as<std::string>();
        }
        if (node["prefix"])
        {
            config.options.file_name_prefix = node["prefix"].as<std::string>();
        }
        if (node["max_workers"])
        {
            int workers = node["max_workers"].as<int>();
            if (workers < 1)
            {
                throw std::invalid_argument("max_workers must be at least 1");
            }
            config.options.max_workers = static_cast<std::size_t>(workers);
        }
        if (node["min_chunk_size"])
        {
            config.options.min_chunk_size = node["min_chunk_size"].as<std::int64_t>();
        }
        if (node["overwrite"])
        {
            config.options.overwrite = node["overwrite"].as<bool>();
        }
        if (node["timeout"])
        {
            double seconds = node["timeout"].as<double>();
            if (seconds < 0)
            {
                throw std::invalid_argument("timeout must not be negative");
            }
            config.options.timeout
                = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000));
        }
        if (node["retries"])
        {
            config.options.max_retries = node["retries"].as<int>();
        }
        if (node["cookies"])
        {
            const YAML::Node& cookies = node["cookies"];
            for (YAML::const_iterator it = cookies.begin(); it != cookies.end(); ++it)
            {
                config.options.cookies.push_back(
                    Cookie{ it->first.as<std::string>(), it->second.as<std::string>() });
            }
        }
        if (node["proxies"])
        {
            const YAML::Node& proxies = node["proxies"];
            for (YAML::const_iterator it = proxies.begin(); it != proxies.end(); ++it)
            {
                config.proxies[it->first.as<std::string>()] = it->second.as<std::string>();
            }
        }
        if (node["headers"])
        {
            auto headers = node["headers"].as<std::vector<std::string>>();
            config.headers.insert(config.headers.end(), headers.begin(), headers.end());
        }
    }

    void load_config_file(const std::filesystem::path& path, CliConfig& config)
    {
        spdlog::info("Loading file {}", path.string());
        load_config(YAML::LoadFile(path.string()), config);
    }

    Cookie parse_cookie(const std::string& text)
    {
        auto eq = text.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            throw std::invalid_argument("cookie must look like name=value: " + text);
        }
        return Cookie{ std::string(strip(text.substr(0, eq))),
                       std::string(strip(text.substr(eq + 1))) };
    }

    TerminalChooser::TerminalChooser(std::istream& in, std::ostream& out)
        : m_in(in)
        , m_out(out)
    {
    }

    std::optional<std::filesystem::path> TerminalChooser::choose_save_location(
        const std::filesystem::path& suggested)
    {
        m_out << "Save to [" << suggested.string() << "] ('-' to cancel): ";
        m_out.flush();

        std::string answer;
        if (!std::getline(m_in, answer))
        {
            return std::nullopt;
        }
        std::string_view choice = strip(answer);
        if (choice == "-")
        {
            return std::nullopt;
        }
        if (choice.empty())
        {
            return suggested;
        }
        return std::filesystem::path(std::string(choice));
    }
}

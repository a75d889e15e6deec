#ifndef PARAFETCH_CLI_CONFIG_HPP
#define PARAFETCH_CLI_CONFIG_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <parafetch/context.hpp>
#include <parafetch/destination.hpp>
#include <parafetch/options.hpp>

namespace parafetch::cli
{
    struct CliConfig
    {
        std::vector<std::string> targets;
        Options options;
        proxy_map_type proxies;
        std::vector<std::string> headers;
    };

    // Merges the keys found in `node` into `config`. Unknown keys are ignored,
    // values of the wrong type throw `YAML::Exception`, out of range numbers
    // throw `std::invalid_argument`.
    void load_config(const YAML::Node& node, CliConfig& config);
    void load_config_file(const std::filesystem::path& path, CliConfig& config);

    // "name=value" -> Cookie, throws `std::invalid_argument` without '='.
    Cookie parse_cookie(const std::string& text);

    // Asks on a terminal: an empty answer keeps the suggestion, "-" declines.
    class TerminalChooser : public DestinationChooser
    {
    public:
        TerminalChooser(std::istream& in, std::ostream& out);

        std::optional<std::filesystem::path> choose_save_location(
            const std::filesystem::path& suggested) override;

    private:
        std::istream& m_in;
        std::ostream& m_out;
    };
}

#endif

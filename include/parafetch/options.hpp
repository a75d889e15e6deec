#ifndef PARAFETCH_OPTIONS_HPP
#define PARAFETCH_OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <parafetch/export.hpp>

namespace parafetch
{
    namespace fs = std::filesystem;

    struct Cookie
    {
        std::string name;
        std::string value;
    };

    // Renders cookies as the value of a single `Cookie:` request header.
    PARAFETCH_API std::string cookie_header_value(const std::vector<Cookie>& cookies);

    // Per-job configuration. A Job keeps its own copy, taken when it is created.
    struct PARAFETCH_API Options
    {
        fs::path dir = fs::current_path();
        std::string file_name_prefix;

        std::size_t max_workers = 4;
        std::int64_t min_chunk_size = 500 * 1024;

        // Only has an effect when a DestinationChooser is installed.
        bool use_destination_chooser = true;
        // Replace an existing destination instead of picking `base(N).ext`.
        bool overwrite = false;

        std::vector<Cookie> cookies;

        // Bounds the whole fetch phase. Zero disables the deadline.
        std::chrono::milliseconds timeout = std::chrono::seconds(10);

        // Retries after the first attempt of each chunk.
        int max_retries = 3;
        // Pause before retry n is n * retry_delay.
        std::chrono::milliseconds retry_delay = std::chrono::milliseconds(100);
    };
}

#endif

#ifndef PARAFETCH_UTILS_HPP
#define PARAFETCH_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <parafetch/export.hpp>

namespace parafetch
{
    namespace fs = std::filesystem;

    PARAFETCH_API bool starts_with(const std::string_view& str, const std::string_view& prefix);

    PARAFETCH_API std::string string_transform(const std::string_view& input, int (*functor)(int));
    PARAFETCH_API std::string to_lower(const std::string_view& input);
    PARAFETCH_API bool contains(const std::string_view& str, const std::string_view& sub_str);
    PARAFETCH_API std::string_view strip(const std::string_view& input);

    // Splits a raw header line into a lower-cased key and its value. Status lines
    // and the terminating empty line come back with an empty key.
    PARAFETCH_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    // Extracts the file name of a Content-Disposition header value. `filename*`
    // (RFC 5987) wins over `filename`; directory components are dropped.
    PARAFETCH_API std::optional<std::string> parse_content_disposition(
        const std::string_view& value);

    PARAFETCH_API std::string percent_decode(const std::string_view& input);

    // Parses a non-negative decimal integer, rejecting anything else.
    PARAFETCH_API std::optional<std::uint64_t> parse_size(const std::string_view& input);

    PARAFETCH_API std::string get_env(const char* var, const std::string& default_value);

    PARAFETCH_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    // Human readable byte count, e.g. "1.5 MiB".
    PARAFETCH_API std::string format_size(std::uint64_t bytes);
}

#endif

#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

#include <parafetch/utils.hpp>

namespace parafetch
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::string_view strip(const std::string_view& input)
    {
        std::size_t start = 0, end = input.size();
        while (start < end && std::isspace(static_cast<unsigned char>(input[start])))
        {
            ++start;
        }
        while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])))
        {
            --end;
        }
        return input.substr(start, end - start);
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos && !starts_with(header, "HTTP/"))
        {
            std::string_view key = header.substr(0, colon_idx);
            // http headers are case insensitive!
            return std::make_pair(to_lower(strip(key)),
                                  std::string(strip(header.substr(colon_idx + 1))));
        }
        return std::make_pair(std::string(), std::string(strip(header)));
    }

    std::string percent_decode(const std::string_view& input)
    {
        auto hex_value = [](char c) -> int
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        };

        std::string res;
        res.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            if (input[i] == '%' && i + 2 < input.size())
            {
                int hi = hex_value(input[i + 1]);
                int lo = hex_value(input[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    res.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                    continue;
                }
            }
            res.push_back(input[i]);
        }
        return res;
    }

    namespace
    {
        std::string unquote(std::string_view value)
        {
            value = strip(value);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            {
                std::string res;
                value = value.substr(1, value.size() - 2);
                for (std::size_t i = 0; i < value.size(); ++i)
                {
                    if (value[i] == '\\' && i + 1 < value.size())
                    {
                        ++i;
                    }
                    res.push_back(value[i]);
                }
                return res;
            }
            return std::string(value);
        }

        std::string base_name(const std::string& name)
        {
            auto pos = name.find_last_of("/\\");
            if (pos == std::string::npos)
            {
                return name;
            }
            return name.substr(pos + 1);
        }
    }

    std::optional<std::string> parse_content_disposition(const std::string_view& value)
    {
        std::optional<std::string> plain, extended;

        auto params = split(value, ";");
        // the first element is the disposition type (attachment, inline)
        for (std::size_t i = 1; i < params.size(); ++i)
        {
            const std::string& param = params[i];
            auto eq = param.find('=');
            if (eq == std::string::npos)
            {
                continue;
            }
            std::string key = to_lower(strip(std::string_view(param).substr(0, eq)));
            std::string_view raw = std::string_view(param).substr(eq + 1);

            if (key == "filename")
            {
                plain = unquote(raw);
            }
            else if (key == "filename*")
            {
                // charset'language'percent-encoded-value
                std::string encoded = unquote(raw);
                auto parts = split(encoded, "'", 2);
                extended = percent_decode(parts.size() == 3 ? parts[2] : encoded);
            }
        }

        std::optional<std::string> name = extended ? extended : plain;
        if (name)
        {
            std::string res = base_name(*name);
            if (!res.empty())
            {
                return res;
            }
        }
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_size(const std::string_view& input)
    {
        std::string_view digits = strip(input);
        if (digits.empty() || digits.size() > 19)
        {
            return std::nullopt;
        }
        std::uint64_t res = 0;
        for (char c : digits)
        {
            if (c < '0' || c > '9')
            {
                return std::nullopt;
            }
            res = res * 10 + static_cast<std::uint64_t>(c - '0');
        }
        return res;
    }

    std::string get_env(const char* var, const std::string& default_value)
    {
        const char* val = std::getenv(var);
        if (!val)
        {
            return default_value;
        }
        return val;
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    std::string format_size(std::uint64_t bytes)
    {
        constexpr const char* units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0]))
        {
            value /= 1024.0;
            ++unit;
        }
        if (unit == 0)
        {
            return fmt::format("{} B", bytes);
        }
        return fmt::format("{:.1f} {}", value, units[unit]);
    }
}

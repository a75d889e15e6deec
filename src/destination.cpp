#include <cerrno>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <parafetch/destination.hpp>
#include <parafetch/utils.hpp>

namespace parafetch
{
    fs::path target_path(const fs::path& dir,
                         const std::string& prefix,
                         const std::string& file_name)
    {
        fs::path name(file_name);
        if (name.is_absolute())
        {
            return name;
        }
        return dir / (prefix + file_name);
    }

    std::string numbered_name(const std::string& file_name, std::size_t index)
    {
        auto dot = file_name.find_last_of('.');
        if (dot == std::string::npos)
        {
            return fmt::format("{}({})", file_name, index);
        }
        return fmt::format("{}({}){}", file_name.substr(0, dot), index, file_name.substr(dot));
    }

    bool is_valid_file_name(const std::string& file_name)
    {
        return !file_name.empty() && contains(file_name, ".");
    }

    namespace
    {
        DownloaderError create_error(const fs::path& path, const std::error_code& ec)
        {
            return DownloaderError{
                ErrorLevel::SERIOUS,
                ErrorCode::PF_IO,
                fmt::format("Could not create {}: {}", path.string(), ec.message()) };
        }
    }

    tl::expected<TargetFile, DownloaderError> create_target_file(const fs::path& dir,
                                                                 const std::string& prefix,
                                                                 const std::string& file_name,
                                                                 bool overwrite)
    {
        const fs::path original = target_path(dir, prefix, file_name);
        const bool absolute = fs::path(file_name).is_absolute();
        const fs::path parent = original.parent_path();

        std::error_code ec;
        if (!parent.empty() && !fs::exists(parent, ec))
        {
            fs::create_directories(parent, ec);
            if (ec)
            {
                return tl::unexpected(create_error(parent, ec));
            }
        }

        TargetFile target;
        target.file_name = file_name;
        target.path = original;

        if (overwrite)
        {
            target.file = std::make_unique<FileIO>(original, FileIO::write_update_binary, ec);
            if (ec)
            {
                return tl::unexpected(create_error(original, ec));
            }
            return target;
        }

        target.file = std::make_unique<FileIO>(original, FileIO::write_exclusive_binary, ec);
        if (!ec)
        {
            return target;
        }
        if (ec != std::errc::file_exists)
        {
            return tl::unexpected(create_error(original, ec));
        }

        const std::string base = original.filename().string();
        for (std::size_t index = 1;; ++index)
        {
            const std::string new_base = numbered_name(base, index);
            const fs::path candidate = parent / new_base;

            target.file = std::make_unique<FileIO>(candidate, FileIO::write_exclusive_binary, ec);
            if (!ec)
            {
                spdlog::info("{} exists, writing to {}", original.string(), candidate.string());
                target.path = candidate;
                if (absolute)
                {
                    target.file_name = candidate.string();
                }
                else
                {
                    target.file_name = starts_with(new_base, prefix)
                                           ? new_base.substr(prefix.size())
                                           : new_base;
                }
                return target;
            }
            if (ec != std::errc::file_exists)
            {
                return tl::unexpected(create_error(candidate, ec));
            }
        }
    }
}

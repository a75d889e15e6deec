#ifndef PARAFETCH_DESTINATION_HPP
#define PARAFETCH_DESTINATION_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/fileio.hpp>

namespace parafetch
{
    namespace fs = std::filesystem;

    // Interactive save-location prompt.
    class PARAFETCH_API DestinationChooser
    {
    public:
        virtual ~DestinationChooser() = default;

        // Blocks until the user picks a path (returned) or declines (std::nullopt).
        virtual std::optional<fs::path> choose_save_location(const fs::path& suggested) = 0;
    };

    // An absolute `file_name` is returned as is, otherwise `dir / (prefix + file_name)`.
    PARAFETCH_API fs::path target_path(const fs::path& dir,
                                       const std::string& prefix,
                                       const std::string& file_name);

    // "name.tar.gz", 2 -> "name.tar(2).gz", ".bashrc", 1 -> "(1).bashrc"
    PARAFETCH_API std::string numbered_name(const std::string& file_name, std::size_t index);

    // A file name is usable when it is not empty and contains an extension separator.
    PARAFETCH_API bool is_valid_file_name(const std::string& file_name);

    struct TargetFile
    {
        std::unique_ptr<FileIO> file;
        fs::path path;
        // File name without the prefix, updated when a numbered name was picked.
        std::string file_name;
    };

    // Creates the destination file. Without `overwrite` an existing file is never
    // touched: the first free `base(N).ext` with N = 1, 2, ... is used instead.
    PARAFETCH_API tl::expected<TargetFile, DownloaderError> create_target_file(
        const fs::path& dir, const std::string& prefix, const std::string& file_name, bool overwrite);
}

#endif

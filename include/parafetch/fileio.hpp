#ifndef PARAFETCH_FILEIO_HPP
#define PARAFETCH_FILEIO_HPP

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#endif

namespace parafetch
{
    namespace fs = std::filesystem;

    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;

    public:
        constexpr static char read_update_binary[] = "rb+";
        constexpr static char write_update_binary[] = "wb+";
        // Fails with EEXIST instead of truncating an existing file.
        constexpr static char write_exclusive_binary[] = "wb+x";
        constexpr static char write_binary[] = "wb";
        constexpr static char read_binary[] = "rb";

        FileIO() = default;

        inline explicit FileIO(const fs::path& file_path,
                               const char* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::fopen(file_path.c_str(), mode);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::debug("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error: {}", ec.message());
                }
            }
        }

        inline int fd() const noexcept
        {
            return ::fileno(m_fs);
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        // 64-bit positional seek, returns 0 on success
        inline int seek(std::int64_t offset, int origin) const noexcept
        {
#ifdef _WIN32
            return ::_fseeki64(m_fs, offset, origin);
#else
            return ::fseeko(m_fs, static_cast<off_t>(offset), origin);
#endif
        }

        inline std::int64_t tell() const noexcept
        {
#ifdef _WIN32
            return ::_ftelli64(m_fs);
#else
            return static_cast<std::int64_t>(::ftello(m_fs));
#endif
        }

        inline std::size_t read(void* buffer,
                                std::size_t element_size,
                                std::size_t element_count) const noexcept
        {
            return ::fread(buffer, element_size, element_count, m_fs);
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) const noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        void truncate(std::int64_t length, std::error_code& ec) const noexcept
        {
#ifdef _WIN32
            fs::resize_file(m_path, static_cast<std::uintmax_t>(length), ec);
#else
            ec.clear();
            if (::ftruncate(fd(), static_cast<off_t>(length)) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
#endif
        }

        inline bool flush() const noexcept
        {
            return ::fflush(m_fs) == 0;
        }

        inline const fs::path& path() const
        {
            return m_path;
        }

        void close(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec.clear();
                return;
            }
            if (::fclose(m_fs) == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
            m_fs = nullptr;
        }

        inline int error() const noexcept
        {
            return ::ferror(m_fs);
        }
    };
}

#endif

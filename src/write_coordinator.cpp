#include <cerrno>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <parafetch/write_coordinator.hpp>

namespace parafetch
{
    WriteCoordinator::WriteCoordinator(std::unique_ptr<FileIO> file)
        : m_file(std::move(file))
    {
        if (!m_file || !m_file->open())
        {
            throw std::invalid_argument("WriteCoordinator needs an open file");
        }
        m_path = m_file->path();
    }

    WriteCoordinator::~WriteCoordinator()
    {
        auto res = close();
        if (!res)
        {
            res.error().log();
        }
    }

    DownloaderError WriteCoordinator::io_error(const std::string& what,
                                               const std::error_code& ec) const
    {
        return DownloaderError{ ErrorLevel::SERIOUS,
                                ErrorCode::PF_IO,
                                fmt::format("{} {}: {}", what, m_path.string(), ec.message()) };
    }

    tl::expected<void, DownloaderError> WriteCoordinator::write_at(std::uint64_t offset,
                                                                   const char* data,
                                                                   std::size_t size)
    {
        return with_write_access(
            [&](FileIO& file) -> tl::expected<void, DownloaderError>
            {
                if (!file.open())
                {
                    return tl::unexpected(io_error("Writing closed file", std::error_code()));
                }
                if (file.seek(static_cast<std::int64_t>(offset), SEEK_SET) != 0)
                {
                    return tl::unexpected(
                        io_error(fmt::format("Seeking to {} in", offset),
                                 std::error_code(errno, std::generic_category())));
                }
                if (file.write(data, 1, size) != size)
                {
                    return tl::unexpected(
                        io_error("Writing", std::error_code(errno, std::generic_category())));
                }
                m_bytes_written += size;
                spdlog::trace("Wrote {} bytes at offset {}", size, offset);
                return {};
            });
    }

    tl::expected<void, DownloaderError> WriteCoordinator::resize(std::uint64_t size)
    {
        return with_write_access(
            [&](FileIO& file) -> tl::expected<void, DownloaderError>
            {
                std::error_code ec;
                file.truncate(static_cast<std::int64_t>(size), ec);
                if (ec)
                {
                    return tl::unexpected(io_error("Resizing", ec));
                }
                return {};
            });
    }

    tl::expected<void, DownloaderError> WriteCoordinator::close()
    {
        return with_write_access(
            [&](FileIO& file) -> tl::expected<void, DownloaderError>
            {
                if (!file.open())
                {
                    return {};
                }
                bool flushed = file.flush();
                int flush_errno = errno;
                std::error_code ec;
                file.close(ec);
                if (!flushed)
                {
                    return tl::unexpected(
                        io_error("Flushing", std::error_code(flush_errno, std::generic_category())));
                }
                if (ec)
                {
                    return tl::unexpected(io_error("Closing", ec));
                }
                return {};
            });
    }

    std::uint64_t WriteCoordinator::bytes_written() const noexcept
    {
        return m_bytes_written.load();
    }

    const fs::path& WriteCoordinator::path() const
    {
        return m_path;
    }
}

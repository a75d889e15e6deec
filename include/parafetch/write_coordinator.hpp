#ifndef PARAFETCH_WRITE_COORDINATOR_HPP
#define PARAFETCH_WRITE_COORDINATOR_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include <tl/expected.hpp>

#include <parafetch/export.hpp>
#include <parafetch/errors.hpp>
#include <parafetch/fileio.hpp>

namespace parafetch
{
    // Owns the destination file of a job and serializes positional writes to it.
    // Every seek-then-write pair runs under one lock, so concurrent workers never
    // interleave between another worker's seek and write.
    class PARAFETCH_API WriteCoordinator
    {
    public:
        explicit WriteCoordinator(std::unique_ptr<FileIO> file);
        ~WriteCoordinator();

        WriteCoordinator(const WriteCoordinator&) = delete;
        WriteCoordinator& operator=(const WriteCoordinator&) = delete;

        template <class F>
        auto with_write_access(F&& fn) -> decltype(fn(std::declval<FileIO&>()))
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return fn(*m_file);
        }

        tl::expected<void, DownloaderError> write_at(std::uint64_t offset,
                                                     const char* data,
                                                     std::size_t size);

        // Sets the file length before workers start writing.
        tl::expected<void, DownloaderError> resize(std::uint64_t size);

        // Flushes and releases the file handle.
        tl::expected<void, DownloaderError> close();

        std::uint64_t bytes_written() const noexcept;
        const fs::path& path() const;

    private:
        DownloaderError io_error(const std::string& what, const std::error_code& ec) const;

        std::mutex m_mutex;
        std::unique_ptr<FileIO> m_file;
        fs::path m_path;
        std::atomic<std::uint64_t> m_bytes_written{ 0 };
    };
}

#endif

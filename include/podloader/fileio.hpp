#ifndef PODLOADER_FILEIO_HPP
#define PODLOADER_FILEIO_HPP

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

namespace podloader
{
    namespace fs = std::filesystem;

    // Owning wrapper around a C stream, closed on destruction.
    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;

    public:
        constexpr static char write_binary[] = "wb";
        constexpr static char append_binary[] = "ab";

        FileIO() = default;

        inline explicit FileIO(const fs::path& file_path, const char* mode, std::error_code& ec)
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
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error closing {}: {}", m_path.string(), ec.message());
                }
            }
        }

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        inline std::streamoff tell() const noexcept
        {
            return ::ftell(m_fs);
        }

        // Flushes the stream and the kernel buffers of the file.
        inline void sync(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec = std::make_error_code(std::errc::bad_file_descriptor);
                return;
            }
            if (::fflush(m_fs) != 0 || ::fsync(::fileno(m_fs)) != 0)
            {
                ec.assign(errno, std::generic_category());
                return;
            }
            ec.clear();
        }

        inline void close(std::error_code& ec) noexcept
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
    };

    // Makes a rename into `dir` durable.
    inline void sync_directory(const fs::path& dir, std::error_code& ec) noexcept
    {
        const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
        if (fd < 0)
        {
            ec.assign(errno, std::generic_category());
            return;
        }
        if (::fsync(fd) != 0)
        {
            ec.assign(errno, std::generic_category());
            ::close(fd);
            return;
        }
        ::close(fd);
        ec.clear();
    }
}

#endif

#include <spdlog/spdlog.h>

#include <podloader/fileio.hpp>
#include <podloader/storage.hpp>
#include <podloader/utils.hpp>

namespace podloader
{
    namespace
    {
        // statvfs needs an existing path. A download directory that is not
        // created yet lives on the filesystem of its closest existing ancestor.
        fs::path nearest_existing(fs::path path)
        {
            std::error_code ec;
            path = fs::absolute(path, ec);
            // the root is its own parent, stop there
            while (!path.empty() && !fs::exists(path, ec))
            {
                if (path == path.parent_path())
                    break;
                path = path.parent_path();
            }
            return path;
        }
    }

    tl::expected<std::uintmax_t, std::error_code> StorageMonitor::available_space(
        const fs::path& path) const
    {
        std::error_code ec;
        const fs::space_info info = fs::space(nearest_existing(path), ec);
        if (ec)
            return tl::unexpected(ec);
        return info.available;
    }

    bool StorageMonitor::has_space(const fs::path& path, std::uintmax_t required) const
    {
        auto available = available_space(path);
        if (!available)
        {
            spdlog::error("Could not query free space for {}: {}",
                          path.string(),
                          available.error().message());
            return false;
        }

        const std::uintmax_t needed = required + SPACE_SAFETY_BUFFER;
        spdlog::debug("Free space in {}: {} (need more than {})",
                      path.string(),
                      format_bytes(available.value()),
                      format_bytes(needed));
        // exactly the buffer left over is already too little
        return available.value() > needed;
    }

    StorageReport StorageMonitor::validate(const fs::path& path) const
    {
        StorageReport report;
        std::error_code ec;

        if (!fs::exists(path, ec))
        {
            report.ok = false;
            report.issues.push_back(fmt::format("Directory does not exist: {}", path.string()));
            return report;
        }
        if (!fs::is_directory(path, ec))
        {
            report.ok = false;
            report.issues.push_back(fmt::format("Not a directory: {}", path.string()));
            return report;
        }

        const fs::path marker = path / ".write-test";
        {
            FileIO writer(marker, FileIO::write_binary, ec);
            if (!ec)
            {
                constexpr char payload[] = "test";
                if (writer.write(payload, 1, sizeof(payload) - 1) != sizeof(payload) - 1)
                    ec.assign(EIO, std::generic_category());
                std::error_code close_ec;
                writer.close(close_ec);
                if (!ec)
                    ec = close_ec;
            }
        }
        if (ec)
        {
            report.ok = false;
            report.issues.push_back(
                fmt::format("Directory is not writable: {} ({})", path.string(), ec.message()));
        }

        std::error_code rm_ec;
        fs::remove(marker, rm_ec);
        return report;
    }
}

#ifndef PODLOADER_STORAGE_HPP
#define PODLOADER_STORAGE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <tl/expected.hpp>

#include <podloader/export.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    // Always kept free on top of what a download requires.
    constexpr std::uintmax_t SPACE_SAFETY_BUFFER = 100ULL * 1024 * 1024;

    struct PODLOADER_API StorageReport
    {
        bool ok = true;
        std::vector<std::string> issues;
    };

    class PODLOADER_API StorageMonitor
    {
    public:
        virtual ~StorageMonitor() = default;

        // Free bytes on the filesystem holding `path` (or its nearest existing ancestor).
        virtual tl::expected<std::uintmax_t, std::error_code> available_space(
            const fs::path& path) const;

        // True iff the free space exceeds `required` plus the safety buffer.
        bool has_space(const fs::path& path, std::uintmax_t required) const;

        // Checks that `path` exists and is writable, problems are reported, not thrown.
        StorageReport validate(const fs::path& path) const;
    };
}

#endif

#ifndef PODLOADER_STAGER_HPP
#define PODLOADER_STAGER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/context.hpp>
#include <podloader/episode.hpp>
#include <podloader/errors.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    class EpisodeStore;
    class EpisodeLocks;

    struct PODLOADER_API ReconcileReport
    {
        std::size_t checked = 0;
        std::size_t demoted = 0;
        std::vector<std::string> issues;
    };

    // Moves files between their temporary, final and done locations.
    class PODLOADER_API FileStager
    {
    public:
        explicit FileStager(const Context& ctx);

        // Renames `temp` to `final`. Fails with kMISSING_TEMP_FILE if `temp` is gone.
        tl::expected<fs::path, DownloadError> finalize(const fs::path& temp,
                                                       const fs::path& final) const;

        // Removes `temp` if it exists. Never fails.
        void cleanup(const fs::path& temp) const;

        // Problems with the file of an episode whose status implies one.
        std::vector<std::string> check_file(const Episode& episode) const;

        // Demotes every episode whose file is missing, empty or misnamed.
        ReconcileReport reconcile(EpisodeStore& store, EpisodeLocks& locks) const;

        tl::expected<fs::path, DownloadError> move_to_done(const fs::path& path) const;
        tl::expected<fs::path, DownloadError> move_back(const fs::path& path) const;

    private:
        tl::expected<fs::path, DownloadError> move(const fs::path& from,
                                                   const fs::path& dir) const;

        const Context& m_context;
    };
}

#endif

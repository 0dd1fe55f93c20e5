#include <spdlog/spdlog.h>

#include <podloader/episode_store.hpp>
#include <podloader/fileio.hpp>
#include <podloader/locks.hpp>
#include <podloader/naming.hpp>
#include <podloader/stager.hpp>

namespace podloader
{
    FileStager::FileStager(const Context& ctx)
        : m_context(ctx)
    {
    }

    tl::expected<fs::path, DownloadError> FileStager::finalize(const fs::path& temp,
                                                               const fs::path& final) const
    {
        std::error_code ec;
        if (!fs::exists(temp, ec))
        {
            return tl::unexpected(
                DownloadError{ ErrorCode::kMISSING_TEMP_FILE,
                               ErrorLevel::SERIOUS,
                               fmt::format("Temporary file {} does not exist", temp.string()) });
        }

        // rename only, a half copied final file must never be visible
        fs::rename(temp, final, ec);
        if (ec)
        {
            return tl::unexpected(DownloadError{ ErrorCode::kIO,
                                                 ErrorLevel::SERIOUS,
                                                 fmt::format("Could not rename {} to {}: {}",
                                                             temp.string(),
                                                             final.string(),
                                                             ec.message()) });
        }

        // the rename itself is durable only once the directory entry is synced
        const fs::path dir = final.has_parent_path() ? final.parent_path() : fs::path(".");
        sync_directory(dir, ec);
        if (ec)
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kWRITE,
                ErrorLevel::SERIOUS,
                fmt::format("Could not sync directory {}: {}", dir.string(), ec.message()) });
        }
        spdlog::debug("Finalized {}", final.string());
        return final;
    }

    void FileStager::cleanup(const fs::path& temp) const
    {
        std::error_code ec;
        if (fs::remove(temp, ec))
        {
            spdlog::debug("Removed temporary file {}", temp.string());
        }
        else if (ec)
        {
            spdlog::warn("Could not remove {}: {}", temp.string(), ec.message());
        }
    }

    std::vector<std::string> FileStager::check_file(const Episode& episode) const
    {
        std::vector<std::string> issues;
        if (!expects_file(episode.status))
            return issues;

        if (episode.local_path.empty())
        {
            issues.push_back(fmt::format("Episode {} is {} but has no local path",
                                         episode.episode_id,
                                         to_string(episode.status)));
            return issues;
        }

        const fs::path path = episode.local_path;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            issues.push_back(fmt::format("File not found: {}", path.string()));
            return issues;
        }

        const auto size = fs::file_size(path, ec);
        if (ec || size == 0)
        {
            issues.push_back(fmt::format("File is empty: {}", path.string()));
        }

        if (!name_matches(episode, path))
        {
            issues.push_back(fmt::format("File name {} does not match expected {}",
                                         path.filename().string(),
                                         final_name(episode)));
        }
        return issues;
    }

    ReconcileReport FileStager::reconcile(EpisodeStore& store, EpisodeLocks& locks) const
    {
        ReconcileReport report;

        for (const auto& candidate : store.get_all())
        {
            if (!expects_file(candidate.status))
                continue;

            auto guard = locks.lock(candidate.episode_id);
            // the record may have changed before the lock was taken
            auto episode = store.get_by_id(candidate.id);
            if (!episode || !expects_file(episode->status))
                continue;

            ++report.checked;
            auto issues = check_file(*episode);
            if (issues.empty())
                continue;

            std::string reason = issues.front();
            for (std::size_t i = 1; i < issues.size(); ++i)
                reason += "; " + issues[i];

            EpisodeUpdate update;
            update.status = EpisodeStatus::kFAILED;
            update.local_path = std::string();
            update.last_error = reason;
            store.update(episode->id, update);

            spdlog::warn("Episode {} demoted to failed: {}", episode->episode_id, reason);
            ++report.demoted;
            for (auto& issue : issues)
                report.issues.push_back(std::move(issue));
        }

        spdlog::info("Reconciliation checked {} episodes, demoted {}",
                     report.checked,
                     report.demoted);
        return report;
    }

    tl::expected<fs::path, DownloadError> FileStager::move(const fs::path& from,
                                                           const fs::path& dir) const
    {
        std::error_code ec;
        if (!fs::is_regular_file(from, ec))
        {
            return tl::unexpected(DownloadError{ ErrorCode::kIO,
                                                 ErrorLevel::SERIOUS,
                                                 fmt::format("File not found: {}", from.string()) });
        }

        fs::create_directories(dir, ec);
        if (ec)
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kIO,
                ErrorLevel::SERIOUS,
                fmt::format("Could not create directory {}: {}", dir.string(), ec.message()) });
        }

        const fs::path target = dir / from.filename();
        fs::rename(from, target, ec);
        if (ec)
        {
            return tl::unexpected(DownloadError{ ErrorCode::kIO,
                                                 ErrorLevel::SERIOUS,
                                                 fmt::format("Could not move {} to {}: {}",
                                                             from.string(),
                                                             target.string(),
                                                             ec.message()) });
        }
        return target;
    }

    tl::expected<fs::path, DownloadError> FileStager::move_to_done(const fs::path& path) const
    {
        return move(path, m_context.done_dir());
    }

    tl::expected<fs::path, DownloadError> FileStager::move_back(const fs::path& path) const
    {
        return move(path, m_context.download_dir);
    }
}

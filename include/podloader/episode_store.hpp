#ifndef PODLOADER_EPISODE_STORE_HPP
#define PODLOADER_EPISODE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/episode.hpp>
#include <podloader/errors.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    // Persistence of episode records. Implementations must be thread-safe.
    class PODLOADER_API EpisodeStore
    {
    public:
        virtual ~EpisodeStore() = default;

        virtual std::optional<Episode> get_by_id(std::int64_t id) const = 0;
        virtual std::optional<Episode> get_by_episode_id(std::int64_t episode_id) const = 0;
        virtual std::vector<Episode> get_by_status(EpisodeStatus status) const = 0;
        virtual std::vector<Episode> get_all() const = 0;

        // Applies a partial update and returns the updated record, or nothing
        // if there is no record with this id.
        virtual std::optional<Episode> update(std::int64_t id, const EpisodeUpdate& update) = 0;

        // Inserts a new record and returns it with its row id. Nothing is
        // inserted if a record with the same episode_id already exists.
        virtual std::optional<Episode> insert(Episode episode) = 0;
    };

    class PODLOADER_API MemoryEpisodeStore : public EpisodeStore
    {
    public:
        MemoryEpisodeStore() = default;

        std::optional<Episode> get_by_id(std::int64_t id) const override;
        std::optional<Episode> get_by_episode_id(std::int64_t episode_id) const override;
        std::vector<Episode> get_by_status(EpisodeStatus status) const override;
        std::vector<Episode> get_all() const override;

        std::optional<Episode> update(std::int64_t id, const EpisodeUpdate& update) override;
        std::optional<Episode> insert(Episode episode) override;

        std::size_t size() const;

    private:
        mutable std::mutex m_mutex;
        std::map<std::int64_t, Episode> m_episodes;
        std::int64_t m_next_id = 1;
    };

    // Memory store backed by a JSON file. Every change other than a pure
    // progress update rewrites the file atomically.
    class PODLOADER_API JsonEpisodeStore : public MemoryEpisodeStore
    {
    public:
        // Loads `path` if it exists, throws std::runtime_error if it cannot be parsed.
        explicit JsonEpisodeStore(const fs::path& path);
        ~JsonEpisodeStore() override;

        std::optional<Episode> update(std::int64_t id, const EpisodeUpdate& update) override;
        std::optional<Episode> insert(Episode episode) override;

        tl::expected<void, DownloadError> flush();

        const fs::path& path() const noexcept
        {
            return m_path;
        }

    private:
        void load();

        fs::path m_path;
        std::mutex m_file_mutex;
        bool m_dirty = false;
    };
}

#endif

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <podloader/episode_store.hpp>
#include <podloader/fileio.hpp>

namespace podloader
{
    /**********************
     * MemoryEpisodeStore *
     **********************/

    std::optional<Episode> MemoryEpisodeStore::get_by_id(std::int64_t id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_episodes.find(id);
        if (it == m_episodes.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<Episode> MemoryEpisodeStore::get_by_episode_id(std::int64_t episode_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, episode] : m_episodes)
        {
            if (episode.episode_id == episode_id)
                return episode;
        }
        return std::nullopt;
    }

    std::vector<Episode> MemoryEpisodeStore::get_by_status(EpisodeStatus status) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Episode> result;
        for (const auto& [id, episode] : m_episodes)
        {
            if (episode.status == status)
                result.push_back(episode);
        }
        return result;
    }

    std::vector<Episode> MemoryEpisodeStore::get_all() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Episode> result;
        result.reserve(m_episodes.size());
        for (const auto& [id, episode] : m_episodes)
            result.push_back(episode);
        return result;
    }

    std::optional<Episode> MemoryEpisodeStore::update(std::int64_t id, const EpisodeUpdate& update)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_episodes.find(id);
        if (it == m_episodes.end())
            return std::nullopt;

        if (update.apply_to(it->second))
            it->second.updated_at = clock_type::now();
        return it->second;
    }

    std::optional<Episode> MemoryEpisodeStore::insert(Episode episode)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, existing] : m_episodes)
        {
            if (existing.episode_id == episode.episode_id)
                return std::nullopt;
        }

        if (episode.id == 0 || m_episodes.count(episode.id))
            episode.id = m_next_id;
        m_next_id = std::max(m_next_id, episode.id + 1);

        const auto now = clock_type::now();
        if (episode.created_at == clock_type::time_point{})
            episode.created_at = now;
        if (episode.updated_at == clock_type::time_point{})
            episode.updated_at = now;

        m_episodes.emplace(episode.id, episode);
        return episode;
    }

    std::size_t MemoryEpisodeStore::size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_episodes.size();
    }

    /********************
     * JsonEpisodeStore *
     ********************/

    JsonEpisodeStore::JsonEpisodeStore(const fs::path& path)
        : m_path(path)
    {
        load();
    }

    JsonEpisodeStore::~JsonEpisodeStore()
    {
        bool dirty = false;
        {
            std::lock_guard<std::mutex> lock(m_file_mutex);
            dirty = m_dirty;
        }
        if (dirty)
        {
            auto res = flush();
            if (!res)
                res.error().log();
        }
    }

    void JsonEpisodeStore::load()
    {
        if (!fs::exists(m_path))
        {
            spdlog::info("Episode store {} does not exist yet", m_path.string());
            return;
        }

        std::ifstream in(m_path);
        if (!in)
        {
            throw std::runtime_error(fmt::format("Could not open {}", m_path.string()));
        }

        nlohmann::json j;
        try
        {
            in >> j;
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw std::runtime_error(
                fmt::format("Could not parse episode store {}: {}", m_path.string(), e.what()));
        }

        if (!j.is_array())
        {
            throw std::runtime_error(
                fmt::format("Episode store {} must contain a JSON array", m_path.string()));
        }

        for (const auto& item : j)
        {
            Episode episode = item.get<Episode>();
            if (!MemoryEpisodeStore::insert(episode))
            {
                spdlog::warn("Skipping duplicate episode {} in {}",
                             episode.episode_id,
                             m_path.string());
            }
        }
        spdlog::debug("Loaded {} episodes from {}", size(), m_path.string());
    }

    std::optional<Episode> JsonEpisodeStore::update(std::int64_t id, const EpisodeUpdate& update)
    {
        auto result = MemoryEpisodeStore::update(id, update);
        if (!result)
            return result;

        if (update.progress_only())
        {
            std::lock_guard<std::mutex> lock(m_file_mutex);
            m_dirty = true;
            return result;
        }

        auto saved = flush();
        if (!saved)
            saved.error().log();
        return result;
    }

    std::optional<Episode> JsonEpisodeStore::insert(Episode episode)
    {
        auto result = MemoryEpisodeStore::insert(std::move(episode));
        if (result)
        {
            auto saved = flush();
            if (!saved)
                saved.error().log();
        }
        return result;
    }

    tl::expected<void, DownloadError> JsonEpisodeStore::flush()
    {
        std::lock_guard<std::mutex> lock(m_file_mutex);

        // snapshot under the file lock so that the last writer has the latest state
        const nlohmann::json j = get_all();
        const std::string content = j.dump(2);

        fs::path tmp = m_path;
        tmp += ".tmp";

        auto io_error = [&](const std::string& what, const std::error_code& ec)
        {
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            return tl::unexpected(DownloadError{
                ErrorCode::kIO,
                ErrorLevel::SERIOUS,
                fmt::format("{} {}: {}", what, m_path.string(), ec.message()) });
        };

        std::error_code ec;
        if (m_path.has_parent_path())
        {
            fs::create_directories(m_path.parent_path(), ec);
            if (ec)
                return io_error("Could not create directory for", ec);
        }

        {
            FileIO out(tmp, FileIO::write_binary, ec);
            if (ec)
                return io_error("Could not write", ec);
            if (out.write(content.data(), 1, content.size()) != content.size())
            {
                return io_error("Could not write",
                                std::error_code(errno, std::generic_category()));
            }
            out.sync(ec);
            if (ec)
                return io_error("Could not sync", ec);
            out.close(ec);
            if (ec)
                return io_error("Could not close", ec);
        }

        fs::rename(tmp, m_path, ec);
        if (ec)
            return io_error("Could not replace", ec);
        sync_directory(m_path.has_parent_path() ? m_path.parent_path() : fs::path("."), ec);
        if (ec)
            return io_error("Could not sync directory of", ec);

        m_dirty = false;
        return {};
    }
}

#ifndef PODLOADER_EPISODE_HPP
#define PODLOADER_EPISODE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <podloader/export.hpp>
#include <podloader/enums.hpp>

namespace podloader
{
    using clock_type = std::chrono::system_clock;

    struct PODLOADER_API Episode
    {
        // Row id assigned by the store, 0 until the episode is inserted.
        std::int64_t id = 0;

        std::int64_t episode_id = 0;
        std::int64_t podcast_id = 0;
        std::string podcast_name;
        std::string episode_title;
        std::string published_date;
        std::string audio_url;

        EpisodeStatus status = EpisodeStatus::kPENDING;
        int progress = 0;
        std::string local_path;
        int retry_count = 0;
        std::string last_error;

        clock_type::time_point created_at{};
        clock_type::time_point updated_at{};
    };

    // Partial update of an episode record. Unset fields are left untouched,
    // an empty `local_path` or `last_error` clears the field.
    struct PODLOADER_API EpisodeUpdate
    {
        std::optional<EpisodeStatus> status;
        std::optional<int> progress;
        std::optional<std::string> local_path;
        std::optional<int> retry_count;
        std::optional<std::string> last_error;

        bool empty() const noexcept
        {
            return !status && !progress && !local_path && !retry_count && !last_error;
        }

        // True when the update only carries a progress value.
        bool progress_only() const noexcept
        {
            return progress && !status && !local_path && !retry_count && !last_error;
        }

        // Applies the update, returns true if any field changed.
        bool apply_to(Episode& episode) const;
    };

    PODLOADER_API const char* to_string(EpisodeStatus status) noexcept;
    PODLOADER_API std::optional<EpisodeStatus> status_from_string(std::string_view str) noexcept;

    // Statuses for which a file is expected on disk.
    PODLOADER_API bool expects_file(EpisodeStatus status) noexcept;

    PODLOADER_API void to_json(nlohmann::json& j, const Episode& episode);
    PODLOADER_API void from_json(const nlohmann::json& j, Episode& episode);
}

#endif

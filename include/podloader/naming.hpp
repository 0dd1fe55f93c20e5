#ifndef PODLOADER_NAMING_HPP
#define PODLOADER_NAMING_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <podloader/export.hpp>
#include <podloader/episode.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    // Normalizes a published date to YYYY-MM-DD, or UNKNOWN_DATE when it
    // cannot be parsed.
    PODLOADER_API std::string format_published_date(std::string_view published);

    // {podcast_id}_{episode_id}_{date}.mp3
    PODLOADER_API std::string final_name(const Episode& episode);
    PODLOADER_API std::string temp_name(const Episode& episode);

    PODLOADER_API fs::path final_path(const Episode& episode, const fs::path& dir);
    PODLOADER_API fs::path temp_path(const Episode& episode, const fs::path& dir);

    struct PODLOADER_API ParsedName
    {
        std::int64_t podcast_id = 0;
        std::int64_t episode_id = 0;
        std::string date;

        bool operator==(const ParsedName& other) const noexcept
        {
            return podcast_id == other.podcast_id && episode_id == other.episode_id
                   && date == other.date;
        }
        bool operator!=(const ParsedName& other) const noexcept
        {
            return !(*this == other);
        }
    };

    // Inverse of `final_name`, the extension is ignored.
    PODLOADER_API std::optional<ParsedName> parse_name(std::string_view filename);
    PODLOADER_API bool is_valid_name(std::string_view filename);

    // True if the basename of `path` is the final name of `episode`.
    PODLOADER_API bool name_matches(const Episode& episode, const fs::path& path);
}

#endif

#include <podloader/episode.hpp>

#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace podloader
{
    namespace
    {
        std::int64_t to_seconds(clock_type::time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        }

        clock_type::time_point from_seconds(std::int64_t seconds)
        {
            return clock_type::time_point(std::chrono::seconds(seconds));
        }
    }

    bool EpisodeUpdate::apply_to(Episode& episode) const
    {
        bool changed = false;
        auto assign = [&changed](auto& field, const auto& value)
        {
            if (value && field != *value)
            {
                field = *value;
                changed = true;
            }
        };

        assign(episode.status, status);
        assign(episode.progress, progress);
        assign(episode.local_path, local_path);
        assign(episode.retry_count, retry_count);
        assign(episode.last_error, last_error);
        return changed;
    }

    const char* to_string(EpisodeStatus status) noexcept
    {
        switch (status)
        {
            case EpisodeStatus::kPENDING:
                return "pending";
            case EpisodeStatus::kDOWNLOADING:
                return "downloading";
            case EpisodeStatus::kDOWNLOADED:
                return "downloaded";
            case EpisodeStatus::kFAILED:
                return "failed";
            case EpisodeStatus::kTRANSCRIBING:
                return "transcribing";
            case EpisodeStatus::kTRANSCRIBED:
                return "transcribed";
        }
        return "unknown";
    }

    std::optional<EpisodeStatus> status_from_string(std::string_view str) noexcept
    {
        for (auto status : { EpisodeStatus::kPENDING,
                             EpisodeStatus::kDOWNLOADING,
                             EpisodeStatus::kDOWNLOADED,
                             EpisodeStatus::kFAILED,
                             EpisodeStatus::kTRANSCRIBING,
                             EpisodeStatus::kTRANSCRIBED })
        {
            if (str == to_string(status))
                return status;
        }
        return std::nullopt;
    }

    bool expects_file(EpisodeStatus status) noexcept
    {
        return status == EpisodeStatus::kDOWNLOADED || status == EpisodeStatus::kTRANSCRIBING
               || status == EpisodeStatus::kTRANSCRIBED;
    }

    void to_json(nlohmann::json& j, const Episode& episode)
    {
        j = nlohmann::json{ { "id", episode.id },
                            { "episode_id", episode.episode_id },
                            { "podcast_id", episode.podcast_id },
                            { "podcast_name", episode.podcast_name },
                            { "episode_title", episode.episode_title },
                            { "published_date", episode.published_date },
                            { "audio_url", episode.audio_url },
                            { "status", to_string(episode.status) },
                            { "progress", episode.progress },
                            { "local_path", episode.local_path },
                            { "retry_count", episode.retry_count },
                            { "last_error", episode.last_error },
                            { "created_at", to_seconds(episode.created_at) },
                            { "updated_at", to_seconds(episode.updated_at) } };
    }

    void from_json(const nlohmann::json& j, Episode& episode)
    {
        // identity and source are mandatory, lifecycle fields default for fresh imports
        j.at("episode_id").get_to(episode.episode_id);
        j.at("podcast_id").get_to(episode.podcast_id);
        j.at("audio_url").get_to(episode.audio_url);

        episode.id = j.value("id", std::int64_t(0));
        episode.podcast_name = j.value("podcast_name", std::string());
        episode.episode_title = j.value("episode_title", std::string());
        episode.published_date = j.value("published_date", std::string());

        const std::string status = j.value("status", std::string("pending"));
        const auto parsed = status_from_string(status);
        if (!parsed)
        {
            throw std::invalid_argument(fmt::format("Unknown episode status '{}'", status));
        }
        episode.status = *parsed;

        episode.progress = j.value("progress", 0);
        episode.local_path = j.value("local_path", std::string());
        episode.retry_count = j.value("retry_count", 0);
        episode.last_error = j.value("last_error", std::string());
        episode.created_at = from_seconds(j.value("created_at", std::int64_t(0)));
        episode.updated_at = from_seconds(j.value("updated_at", std::int64_t(0)));
    }
}

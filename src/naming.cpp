#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#include <spdlog/spdlog.h>

#include <podloader/naming.hpp>
#include <podloader/utils.hpp>

namespace podloader
{
    namespace
    {
        struct CalendarDate
        {
            int year = 0;
            int month = 0;
            int day = 0;
        };

        bool is_leap_year(int year)
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        bool is_valid_date(const CalendarDate& date)
        {
            static constexpr int days_in_month[]
                = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };

            // anything outside this range is a misparse of another layout
            if (date.year < 1900 || date.year > 2999)
                return false;
            if (date.month < 1 || date.month > 12)
                return false;

            int max_day = days_in_month[date.month - 1];
            if (date.month == 2 && is_leap_year(date.year))
                max_day = 29;
            return date.day >= 1 && date.day <= max_day;
        }

        std::optional<CalendarDate> parse_with(std::string_view input, const char* format)
        {
            std::tm tm = {};
            std::istringstream stream{ std::string(input) };
            stream.imbue(std::locale::classic());
            stream >> std::get_time(&tm, format);
            if (stream.fail())
                return std::nullopt;

            CalendarDate date{ tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday };
            if (!is_valid_date(date))
                return std::nullopt;
            return date;
        }

        // Strict YYYY-MM-DD, used when parsing file names back.
        std::optional<CalendarDate> parse_iso_date(std::string_view input)
        {
            if (input.size() != 10 || input[4] != '-' || input[7] != '-')
                return std::nullopt;

            auto year = parse_decimal(input.substr(0, 4));
            auto month = parse_decimal(input.substr(5, 2));
            auto day = parse_decimal(input.substr(8, 2));
            if (!year || !month || !day)
                return std::nullopt;

            CalendarDate date{ static_cast<int>(*year),
                               static_cast<int>(*month),
                               static_cast<int>(*day) };
            if (!is_valid_date(date))
                return std::nullopt;
            return date;
        }
    }

    std::string format_published_date(std::string_view published)
    {
        static constexpr const char* formats[] = {
            "%Y-%m-%d",      // ISO 8601, time part ignored
            "%Y/%m/%d",
            "%a, %d %b %Y",  // RFC 2822
            "%d %b %Y",
            "%b %d, %Y",
            "%m/%d/%Y",
        };

        const auto input = strip(published);
        if (input.empty())
            return UNKNOWN_DATE;

        for (const char* format : formats)
        {
            if (auto date = parse_with(input, format))
            {
                return fmt::format("{:04}-{:02}-{:02}", date->year, date->month, date->day);
            }
        }

        spdlog::debug("Could not parse published date '{}'", input);
        return UNKNOWN_DATE;
    }

    std::string final_name(const Episode& episode)
    {
        return fmt::format("{}_{}_{}{}",
                           episode.podcast_id,
                           episode.episode_id,
                           format_published_date(episode.published_date),
                           AUDIOEXT);
    }

    std::string temp_name(const Episode& episode)
    {
        return fmt::format("{}_{}_{}{}",
                           episode.podcast_id,
                           episode.episode_id,
                           format_published_date(episode.published_date),
                           TMPEXT);
    }

    fs::path final_path(const Episode& episode, const fs::path& dir)
    {
        return dir / final_name(episode);
    }

    fs::path temp_path(const Episode& episode, const fs::path& dir)
    {
        return dir / temp_name(episode);
    }

    std::optional<ParsedName> parse_name(std::string_view filename)
    {
        const std::string stem = fs::path(std::string(filename)).stem().string();
        const auto parts = split(stem, "_");
        if (parts.size() != 3)
            return std::nullopt;

        auto podcast_id = parse_decimal(parts[0]);
        auto episode_id = parse_decimal(parts[1]);
        if (!podcast_id || !episode_id)
            return std::nullopt;

        if (parts[2] != UNKNOWN_DATE && !parse_iso_date(parts[2]))
            return std::nullopt;

        return ParsedName{ *podcast_id, *episode_id, parts[2] };
    }

    bool is_valid_name(std::string_view filename)
    {
        return parse_name(filename).has_value();
    }

    bool name_matches(const Episode& episode, const fs::path& path)
    {
        return path.filename().string() == final_name(episode);
    }
}

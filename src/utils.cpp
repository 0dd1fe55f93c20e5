#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

#include <spdlog/fmt/fmt.h>

#include <podloader/utils.hpp>

namespace podloader
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    std::string_view strip(const std::string_view& input)
    {
        const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        std::size_t start = 0;
        std::size_t end = input.size();
        while (start < end && is_space(input[start]))
            ++start;
        while (end > start && is_space(input[end - 1]))
            --end;
        return input.substr(start, end - start);
    }

    std::optional<std::int64_t> parse_decimal(const std::string_view& input)
    {
        if (input.empty())
            return std::nullopt;

        std::int64_t value = 0;
        for (char c : input)
        {
            if (c < '0' || c > '9')
                return std::nullopt;
            const int digit = c - '0';
            if (value > (std::numeric_limits<std::int64_t>::max() - digit) / 10)
                return std::nullopt;
            value = value * 10 + digit;
        }
        return value;
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key = header.substr(0, colon_idx);
            // http headers are case insensitive!
            return std::make_pair(to_lower(key), std::string(strip(header.substr(colon_idx + 1))));
        }
        return std::make_pair(std::string(), std::string(strip(header)));
    }

    std::string get_env(const char* var, const std::string& default_value)
    {
        const char* val = std::getenv(var);
        if (!val)
        {
            return default_value;
        }
        return val;
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    std::string format_bytes(std::uintmax_t bytes)
    {
        constexpr const char* units[] = { "B", "KB", "MB", "GB", "TB" };
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < std::size(units))
        {
            value /= 1024.0;
            ++unit;
        }
        if (unit == 0)
            return fmt::format("{} B", bytes);
        return fmt::format("{:.1f} {}", value, units[unit]);
    }
}

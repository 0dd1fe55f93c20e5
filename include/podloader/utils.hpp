#ifndef PODLOADER_UTILS_HPP
#define PODLOADER_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <podloader/export.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    PODLOADER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    PODLOADER_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    PODLOADER_API std::string string_transform(const std::string_view& input,
                                               int (*functor)(int));
    PODLOADER_API std::string to_lower(const std::string_view& input);
    PODLOADER_API std::string_view strip(const std::string_view& input);

    // Parses a non-empty run of decimal digits, no sign, no surrounding blanks.
    PODLOADER_API std::optional<std::int64_t> parse_decimal(const std::string_view& input);

    PODLOADER_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);
    PODLOADER_API std::string get_env(const char* var, const std::string& default_value);

    PODLOADER_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    // Human readable byte count ("12.3 MB").
    PODLOADER_API std::string format_bytes(std::uintmax_t bytes);
}

#endif

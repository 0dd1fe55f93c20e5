#ifndef PODLOADER_CONTEXT_HPP
#define PODLOADER_CONTEXT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

#include <podloader/export.hpp>
#include <podloader/enums.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    using proxy_map_type = std::map<std::string, std::string>;

    struct RetryOptions
    {
        int max_attempts = 3;
        std::chrono::milliseconds base_delay{ 5000 };
        double multiplier = 2.0;
        std::chrono::milliseconds max_delay{ 300000 };
        std::chrono::milliseconds min_delay{ 1000 };
        bool jitter = true;
        // 4xx responses other than 408 and 429 are permanent unless set.
        bool retry_client_errors = false;
    };

    class PODLOADER_API Context
    {
    public:
        int verbosity = 0;

        fs::path download_dir = "downloads";
        std::string done_dirname = DONE_DIRNAME;

        // ssl options
        bool disable_ssl = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1L;
        long max_redirects = 5L;
        // whole request timeout of a HEAD check, see `check_url`
        long check_timeout = 10L;

        // This can improve throughput significantly
        // see https://github.com/curl/curl/issues/9601
        long transfer_buffersize = 100 * 1024;

        std::string user_agent = "podloader";
        proxy_map_type proxy_map;
        std::set<std::string> allowed_schemes = { "http", "https" };

        // Free space needed in the download directory on top of the safety buffer.
        std::uintmax_t required_space = 100ULL * 1024 * 1024;
        long max_parallel_downloads = 3L;

        RetryOptions retry;

        Context();

        fs::path done_dir() const;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);
    };
}

#endif

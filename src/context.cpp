#include <podloader/context.hpp>

#include "./curl_internal.hpp"

namespace podloader
{
    Context::Context()
    {
        // libcurl is initialized once per process, several contexts may coexist
        details::CURLSetup::ensure();
        set_verbosity(0);
    }

    fs::path Context::done_dir() const
    {
        return download_dir / done_dirname;
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v > 1)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else if (v > 0)
        {
            spdlog::set_level(spdlog::level::info);
        }
        else
        {
            spdlog::set_level(spdlog::level::warn);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }
}

#ifndef PODLOADER_ERRORS_HPP
#define PODLOADER_ERRORS_HPP

#include <string>

#include <spdlog/spdlog.h>

#include <podloader/export.hpp>
#include <podloader/enums.hpp>

namespace podloader
{
    struct DownloadError
    {
        ErrorCode code;
        ErrorLevel level;
        std::string reason;

        // HTTP status of the final response, 0 when there was none.
        long http_status = 0;

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        bool is_client_error() const noexcept
        {
            return code == ErrorCode::kHTTP_STATUS && http_status >= 400 && http_status < 500;
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(reason);
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(reason);
                    break;
                default:
                    spdlog::warn(reason);
            }
        }
    };

    PODLOADER_API const char* to_string(ErrorCode code) noexcept;
}

#endif

#include <podloader/errors.hpp>

namespace podloader
{
    const char* to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::kINSUFFICIENT_SPACE:
                return "InsufficientSpace";
            case ErrorCode::kNETWORK:
                return "NetworkError";
            case ErrorCode::kHTTP_STATUS:
                return "HttpStatusError";
            case ErrorCode::kWRITE:
                return "WriteError";
            case ErrorCode::kCANCELLED:
                return "Cancelled";
            case ErrorCode::kMISSING_TEMP_FILE:
                return "MissingTempFile";
            case ErrorCode::kBAD_URL:
                return "BadUrl";
            case ErrorCode::kALREADY_ACTIVE:
                return "AlreadyActive";
            case ErrorCode::kNOT_FOUND:
                return "NotFound";
            case ErrorCode::kRETRIES_EXHAUSTED:
                return "RetriesExhausted";
            case ErrorCode::kIO:
                return "IOError";
        }
        return "UnknownError";
    }
}

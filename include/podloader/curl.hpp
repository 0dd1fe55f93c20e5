#ifndef PODLOADER_CURL_HPP
#define PODLOADER_CURL_HPP

#include <map>
#include <string>

extern "C"
{
#include <curl/curl.h>
}

#include <podloader/export.hpp>

namespace podloader
{
    class CURLHandle;

    // Summary of a finished transfer, filled from the handle.
    struct PODLOADER_API Response
    {
        std::map<std::string, std::string> headers;

        long http_status = 0;
        // differs from the requested URL after redirects
        std::string effective_url;
        curl_off_t average_speed = 0;

        void fill_values(CURLHandle& handle);
    };
}

#endif

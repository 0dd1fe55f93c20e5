#ifndef PODLOADER_URL_HPP
#define PODLOADER_URL_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <podloader/export.hpp>
#include <podloader/errors.hpp>

namespace podloader
{
    class Context;

    // Thin wrapper over libcurl's URL API. Throws std::invalid_argument if
    // the url cannot be parsed as an absolute url.
    class PODLOADER_API URLHandler
    {
    public:
        explicit URLHandler(const std::string& url);
        ~URLHandler();

        URLHandler(const URLHandler&) = delete;
        URLHandler& operator=(const URLHandler&) = delete;

        std::string url() const;
        std::string scheme() const;
        std::string host() const;
        std::string path() const;

    private:
        std::string get_part(CURLUPart part) const;

        CURLU* m_handle;
    };

    // Checks that `url` is absolute and uses one of the allowed schemes.
    PODLOADER_API tl::expected<void, DownloadError> validate_url(const Context& ctx,
                                                                 const std::string& url);

    struct PODLOADER_API RemoteFile
    {
        long http_status = 0;
        // unset when the server does not announce a length
        std::optional<std::uintmax_t> content_length;
        std::string content_type;
        std::string effective_url;
    };

    // HEAD request following redirects. Non 2xx answers are kHTTP_STATUS errors.
    PODLOADER_API tl::expected<RemoteFile, DownloadError> check_url(const Context& ctx,
                                                                    const std::string& url);
}

#endif

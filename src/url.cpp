#include <stdexcept>

#include <spdlog/spdlog.h>

#include <podloader/context.hpp>
#include <podloader/url.hpp>
#include <podloader/utils.hpp>

#include "curl_internal.hpp"

namespace podloader
{
    URLHandler::URLHandler(const std::string& url)
        : m_handle(curl_url())
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }

        // without CURLU_DEFAULT_SCHEME a relative or scheme-less url is rejected
        CURLUcode rc = curl_url_set(m_handle, CURLUPART_URL, url.c_str(), 0);
        if (rc != CURLUE_OK)
        {
            curl_url_cleanup(m_handle);
            throw std::invalid_argument(fmt::format("Invalid url '{}'", url));
        }
    }

    URLHandler::~URLHandler()
    {
        curl_url_cleanup(m_handle);
    }

    std::string URLHandler::get_part(CURLUPart part) const
    {
        char* value = nullptr;
        // a missing part (no path, no port) is reported as an empty string
        CURLUcode rc = curl_url_get(m_handle, part, &value, 0);
        if (rc != CURLUE_OK || value == nullptr)
        {
            return {};
        }
        std::string res(value);
        curl_free(value);
        return res;
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    tl::expected<void, DownloadError> validate_url(const Context& ctx, const std::string& url)
    {
        if (strip(url).empty())
        {
            return tl::unexpected(
                DownloadError{ ErrorCode::kBAD_URL, ErrorLevel::FATAL, "Empty audio url" });
        }

        try
        {
            URLHandler handler(url);
            const std::string scheme = to_lower(handler.scheme());
            if (ctx.allowed_schemes.count(scheme) == 0)
            {
                return tl::unexpected(DownloadError{
                    ErrorCode::kBAD_URL,
                    ErrorLevel::FATAL,
                    fmt::format("Unsupported url scheme '{}' in {}", scheme, url) });
            }
            if (handler.host().empty())
            {
                return tl::unexpected(DownloadError{
                    ErrorCode::kBAD_URL, ErrorLevel::FATAL, fmt::format("No host in {}", url) });
            }
        }
        catch (const std::invalid_argument& e)
        {
            return tl::unexpected(DownloadError{ ErrorCode::kBAD_URL, ErrorLevel::FATAL, e.what() });
        }
        return {};
    }

    tl::expected<RemoteFile, DownloadError> check_url(const Context& ctx, const std::string& url)
    {
        if (auto valid = validate_url(ctx, url); !valid)
        {
            return tl::unexpected(valid.error());
        }

        RemoteFile remote;
        CURLcode result = CURLE_OK;
        std::string curl_message;
        try
        {
            CURLHandle handle(ctx, url);
            handle.setopt(CURLOPT_NOBODY, 1L);
            handle.setopt(CURLOPT_TIMEOUT, ctx.check_timeout);

            result = handle.perform();
            if (result != CURLE_OK)
            {
                curl_message = handle.error_message();
            }
            else
            {
                remote.http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);

                auto length = handle.getinfo<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T);
                if (length && length.value() >= 0)
                    remote.content_length = static_cast<std::uintmax_t>(length.value());

                auto type = handle.getinfo<char*>(CURLINFO_CONTENT_TYPE);
                if (type && type.value())
                    remote.content_type = type.value();

                auto effective = handle.getinfo<char*>(CURLINFO_EFFECTIVE_URL);
                if (effective && effective.value())
                    remote.effective_url = effective.value();
            }
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(
                DownloadError{ ErrorCode::kNETWORK, ErrorLevel::FATAL, e.what() });
        }

        if (result != CURLE_OK)
        {
            return tl::unexpected(DownloadError{ ErrorCode::kNETWORK,
                                                 ErrorLevel::INFO,
                                                 fmt::format("CURL error ({}): {} for {} [{}]",
                                                             static_cast<int>(result),
                                                             curl_easy_strerror(result),
                                                             url,
                                                             curl_message) });
        }

        if (remote.http_status / 100 != 2)
        {
            DownloadError err{ ErrorCode::kHTTP_STATUS,
                               ErrorLevel::INFO,
                               fmt::format("Status code: {} for {}", remote.http_status, url) };
            err.http_status = remote.http_status;
            return tl::unexpected(err);
        }

        spdlog::debug("{} is reachable ({} {})",
                      url,
                      remote.http_status,
                      remote.content_type.empty() ? "no content type" : remote.content_type);
        return remote;
    }
}

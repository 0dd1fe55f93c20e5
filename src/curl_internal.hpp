#ifndef PODLOADER_SRC_CURL_INTERNAL_HPP
#define PODLOADER_SRC_CURL_INTERNAL_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <spdlog/fmt/fmt.h>
#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/context.hpp>
#include <podloader/curl.hpp>

namespace podloader
{
    class PODLOADER_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what);
    };

    class PODLOADER_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle& url(const std::string& url, const proxy_map_type& proxies);
        CURLHandle& user_agent(const std::string& user_agent);

        // Runs the transfer with whatever callbacks have been set.
        CURLcode perform();

        // Message from libcurl's error buffer for the last transfer.
        std::string error_message() const;

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();

        CURLHandle& add_header(const std::string& header);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

    private:
        void init_handle(const Context& ctx);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char errorbuffer[CURL_ERROR_SIZE];
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option);

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url);
}

namespace podloader::details
{
    // Process wide initialization and termination of libcurl.
    class CURLSetup final
    {
    public:
        // Initializes libcurl on first call, throws curl_error on failure.
        static void ensure();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;

    private:
        CURLSetup();
        ~CURLSetup();
    };
}
#endif

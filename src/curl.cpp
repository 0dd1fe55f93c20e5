#include <spdlog/spdlog.h>

#include <podloader/curl.hpp>
#include <podloader/url.hpp>

#include "curl_internal.hpp"

namespace podloader
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        init_handle(ctx);
        // Set error buffer
        errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, errorbuffer);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_MAXREDIRS, ctx.max_redirects);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        // idle timeout only, a long episode may take as long as it needs
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        // transfers run on worker threads
        setopt(CURLOPT_NOSIGNAL, 1L);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }
        }

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url, ctx.proxy_map);
        if (!ctx.user_agent.empty())
            user_agent(ctx.user_agent);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url);
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value());
        }
        else
        {
            setopt(CURLOPT_PROXY, nullptr);
        }
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        add_header(fmt::format("User-Agent: {} {}", user_agent, curl_version()));
        return *this;
    }

    CURLcode CURLHandle::perform()
    {
        errorbuffer[0] = '\0';
        return curl_easy_perform(handle());
    }

    std::string CURLHandle::error_message() const
    {
        return errorbuffer;
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<long long, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (!res)
            return tl::unexpected(res.error());
        if (res.value() == nullptr)
            return std::string();
        return std::string(res.value());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }


    /************
     * Response *
     ************/

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
        average_speed = handle.getinfo<curl_off_t>(CURLINFO_SPEED_DOWNLOAD_T).value_or(0);
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // Same lookup order as requests.utils.select_proxy()
        if (proxies.empty())
        {
            return std::nullopt;
        }

        URLHandler handler(url);
        auto scheme = handler.scheme();
        auto host = handler.host();
        std::vector<std::string> options;

        if (host.empty())
        {
            options = {
                scheme,
                "all",
            };
        }
        else
        {
            options = { scheme + "://" + host, scheme, "all://" + host, "all" };
        }

        for (auto& option : options)
        {
            auto proxy = proxies.find(option);
            if (proxy != proxies.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    namespace details
    {
        CURLSetup::CURLSetup()
        {
            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
                throw curl_error("failed to initialize curl");
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
        }

        void CURLSetup::ensure()
        {
            static CURLSetup setup;
        }
    }
}

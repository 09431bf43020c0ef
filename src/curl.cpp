#include <algorithm>
#include <atomic>
#include <vector>

#include <mirrorup/curl.hpp>
#include <mirrorup/context.hpp>
#include <mirrorup/utils.hpp>

#include "curl_internal.hpp"

namespace mirrorup
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
        setopt(CURLOPT_MAXREDIRS, 6L);
        setopt(CURLOPT_NOSIGNAL, 1L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);

        if (ctx.disable_ssl)
        {
            insecure();
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

        if (!ctx.user_agent.empty())
        {
            user_agent(ctx.user_agent);
        }

        if (ctx.verbosity > 2)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url, ctx.proxy_map);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
    }

    CURLHandle::CURLHandle(CURLHandle&& rhs)
        : m_handle(rhs.m_handle)
        , response(std::move(rhs.response))
    {
        rhs.m_handle = nullptr;
        std::copy(&rhs.errorbuffer[0], &rhs.errorbuffer[CURL_ERROR_SIZE], &errorbuffer[0]);
        if (m_handle)
        {
            setopt(CURLOPT_ERRORBUFFER, errorbuffer);
        }
    }

    CURLHandle& CURLHandle::operator=(CURLHandle&& rhs)
    {
        using std::swap;
        swap(m_handle, rhs.m_handle);
        swap(errorbuffer, rhs.errorbuffer);
        swap(response, rhs.response);
        if (m_handle)
        {
            setopt(CURLOPT_ERRORBUFFER, errorbuffer);
        }
        if (rhs.m_handle)
        {
            rhs.setopt(CURLOPT_ERRORBUFFER, rhs.errorbuffer);
        }
        return *this;
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url.c_str());
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value().c_str());
        }
        return *this;
    }

    CURLHandle& CURLHandle::accept_encoding()
    {
        setopt(CURLOPT_ACCEPT_ENCODING, "");
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        setopt(CURLOPT_USERAGENT, user_agent);
        return *this;
    }

    CURLHandle& CURLHandle::insecure()
    {
        setopt(CURLOPT_SSL_VERIFYHOST, 0L);
        setopt(CURLOPT_SSL_VERIFYPEER, 0L);

        // also disable proxy SSL verification
        setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
        setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        return *this;
    }

    Response CURLHandle::perform()
    {
        if (!response)
        {
            set_default_callbacks();
        }
        CURLcode curl_result = curl_easy_perform(handle());
        if (curl_result != CURLE_OK)
        {
            throw curl_error(error_message(curl_result));
        }
        return finish_transfer();
    }

    Response CURLHandle::finish_transfer()
    {
        if (!response)
        {
            response.reset(new Response);
        }
        response->fill_values(*this);
        Response result = std::move(*response);
        response.reset();
        return result;
    }

    std::string CURLHandle::effective_url()
    {
        return getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    std::string CURLHandle::error_message(CURLcode code) const
    {
        if (errorbuffer[0] == '\0')
        {
            return curl_easy_strerror(code);
        }
        return fmt::format("{} [{}]", curl_easy_strerror(code), errorbuffer);
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
    template tl::expected<double, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<long long, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (res && res.value() != nullptr)
            return std::string(res.value());
        else if (res)
            return std::string();
        else
            return tl::unexpected(res.error());
    }

    CURL* CURLHandle::handle()
    {
        return m_handle;
    }

    namespace
    {
        template <class T>
        std::size_t string_callback(char* buffer, std::size_t size, std::size_t nitems, T* string)
        {
            string->append(buffer, size * nitems);
            return size * nitems;
        }

        std::size_t discard_callback(char*, std::size_t size, std::size_t nitems, void*)
        {
            return size * nitems;
        }
    }

    void CURLHandle::set_default_callbacks()
    {
        response.reset(new Response);
        setopt(CURLOPT_WRITEFUNCTION, string_callback<std::string>);
        response->content = std::string();
        setopt(CURLOPT_WRITEDATA, &response->content.value());
    }

    void CURLHandle::discard_content()
    {
        response.reset(new Response);
        setopt(CURLOPT_WRITEFUNCTION, discard_callback);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(nullptr));
    }

    /************
     * Response *
     ************/

    bool Response::ok() const
    {
        if (http_status == 0)
            return starts_with(effective_url, "file:");
        return http_status / 100 == 2;
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
        content_length
            = handle.getinfo<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T).value_or(-1);
        total_time = handle.getinfo<curl_off_t>(CURLINFO_TOTAL_TIME_T).value_or(0);
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // Most specific key first: scheme://host, scheme, all://host, all
        if (proxies.empty())
        {
            return std::nullopt;
        }

        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos)
        {
            return std::nullopt;
        }
        std::string scheme = to_lower(url.substr(0, scheme_end));
        std::string host = url_host(url);
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
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup(const std::optional<ssl_backend_t>& ssl_backend)
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "mirrorup::CURLSetup created more than once - instance must be unique");
            }

            if (ssl_backend)
            {
                const auto res = curl_global_sslset(
                    static_cast<curl_sslbackend>(ssl_backend.value()), nullptr, nullptr);
                if (res == CURLSSLSET_UNKNOWN_BACKEND)
                {
                    is_curl_setup_alive = false;
                    throw curl_error("unknown curl ssl backend");
                }
                else if (res == CURLSSLSET_NO_BACKENDS)
                {
                    is_curl_setup_alive = false;
                    throw curl_error("no curl ssl backend available");
                }
                else if (res == CURLSSLSET_TOO_LATE)
                {
                    is_curl_setup_alive = false;
                    throw curl_error("curl ssl backend set too late");
                }
                else if (res != CURLSSLSET_OK)
                {
                    is_curl_setup_alive = false;
                    throw curl_error("failed to set curl ssl backend");
                }
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}

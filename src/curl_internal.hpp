#ifndef MIRRORUP_SRC_CURL_INTERNAL_HPP
#define MIRRORUP_SRC_CURL_INTERNAL_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/curl.hpp>
#include <mirrorup/context.hpp>

namespace mirrorup
{
    class MIRRORUP_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what = "transfer error");
    };

    class MIRRORUP_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle& url(const std::string& url, const proxy_map_type& proxies);
        CURLHandle& accept_encoding();
        CURLHandle& user_agent(const std::string& user_agent);
        // Turns off peer and host verification, also for proxies.
        CURLHandle& insecure();

        // Runs the transfer and buffers the body. Throws `curl_error` on transport errors,
        // the HTTP status is left for the caller to check.
        Response perform();
        // Response of a transfer driven elsewhere (e.g. by a multi handle) that completed
        // with CURLE_OK.
        Response finish_transfer();

        std::string effective_url();
        std::string error_message(CURLcode code) const;

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        void set_default_callbacks();
        // Counts the body but does not keep it.
        void discard_content();

        CURLHandle(CURLHandle&& rhs);
        CURLHandle& operator=(CURLHandle&& rhs);

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

    private:
        void init_handle(const Context& ctx);

        CURL* m_handle;
        char errorbuffer[CURL_ERROR_SIZE];

        std::unique_ptr<Response> response;
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

namespace mirrorup::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        explicit CURLSetup(const std::optional<ssl_backend_t>& ssl_backend);
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif

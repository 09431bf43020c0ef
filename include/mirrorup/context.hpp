#ifndef MIRRORUP_CONTEXT_HPP
#define MIRRORUP_CONTEXT_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include <mirrorup/export.hpp>
#include <mirrorup/curl.hpp>

namespace mirrorup
{
    namespace fs = std::filesystem;

    using proxy_map_type = std::map<std::string, std::string>;

    // Options provided when starting a mirrorup context.
    struct ContextOptions
    {
        // If set, specifies which SSL backend to use with CURL.
        std::optional<ssl_backend_t> ssl_backend;
    };

    class MIRRORUP_API Context
    {
    public:
        int verbosity = 0;

        // ssl options, used when fetching the mirror status document.
        // Benchmark requests never verify certificates.
        bool disable_ssl = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        // Total time allowed for a single benchmark request, in seconds.
        long probe_timeout = 10L;

        // Mirror status fetch: attempts and exponential backoff between them.
        std::size_t status_fetch_attempts = 5;
        std::size_t retry_backoff_factor = 2;
        std::chrono::steady_clock::duration retry_default_timeout = std::chrono::seconds(1);

        std::string user_agent;
        proxy_map_type proxy_map;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context(ContextOptions options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };

}

#endif

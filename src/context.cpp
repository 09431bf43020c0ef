#include <atomic>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorup/context.hpp>
#include <mirrorup/mirrorup.hpp>

#include "curl_internal.hpp"


namespace mirrorup
{
    struct Context::Impl
    {
        std::optional<details::CURLSetup> curl_setup;
    };

    static std::atomic<bool> is_context_alive{ false };

    Context::Context(ContextOptions options)
        : impl(new Impl)
    {
        bool expected = false;
        if (!is_context_alive.compare_exchange_strong(expected, true))
            throw std::runtime_error(
                "mirrorup::Context created more than once - instance must be unique");

        try
        {
            // curl_global_init is not thread safe, it has to run before any transfer starts
            impl->curl_setup.emplace(options.ssl_backend);
        }
        catch (...)
        {
            is_context_alive = false;
            throw;
        }

        user_agent = fmt::format("mirrorup/{} ({})", MIRRORUP_VERSION_STRING, curl_version());
        set_verbosity(0);
    }

    Context::~Context()
    {
        is_context_alive = false;
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v < 0)
        {
            spdlog::set_level(spdlog::level::err);
        }
        else if (v == 0)
        {
            spdlog::set_level(spdlog::level::info);
        }
        else if (v == 1)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else
        {
            spdlog::set_level(spdlog::level::trace);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }
}

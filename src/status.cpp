#include <algorithm>
#include <chrono>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorup/context.hpp>
#include <mirrorup/status.hpp>

#include "curl_internal.hpp"

namespace mirrorup
{
    tl::expected<MirrorCatalog, MirrorupError> parse_mirror_status(const std::string& text)
    {
        try
        {
            return nlohmann::json::parse(text).get<MirrorCatalog>();
        }
        catch (const nlohmann::json::exception& e)
        {
            return tl::unexpected(MirrorupError::fatal(
                ErrorCode::MU_PARSE, fmt::format("Invalid mirror status document: {}", e.what())));
        }
    }

    namespace
    {
        // One download, transport failures and bad statuses are retryable.
        tl::expected<std::string, MirrorupError> fetch_once(const Context& ctx,
                                                            const std::string& url)
        {
            try
            {
                CURLHandle handle(ctx, url);
                handle.accept_encoding();
                Response response = handle.perform();
                if (!response.ok())
                {
                    return tl::unexpected(MirrorupError{
                        ErrorLevel::SERIOUS,
                        ErrorCode::MU_FETCH,
                        fmt::format("Received HTTP status {} from {}", response.http_status, url) });
                }
                return std::move(response.content.value());
            }
            catch (const curl_error& e)
            {
                return tl::unexpected(MirrorupError{
                    ErrorLevel::SERIOUS, ErrorCode::MU_FETCH, fmt::format("{}: {}", url, e.what()) });
            }
        }
    }

    tl::expected<MirrorCatalog, MirrorupError> fetch_mirror_status(const Context& ctx,
                                                                   const std::string& url)
    {
        const std::size_t attempts = std::max<std::size_t>(ctx.status_fetch_attempts, 1);
        auto wait = ctx.retry_default_timeout;

        MirrorupError last_error{ ErrorLevel::FATAL, ErrorCode::MU_FETCH, "" };
        for (std::size_t attempt = 1; attempt <= attempts; ++attempt)
        {
            spdlog::info("Fetching mirror status from {} (attempt {}/{})", url, attempt, attempts);
            auto body = fetch_once(ctx, url);
            if (body)
            {
                auto catalog = parse_mirror_status(body.value());
                if (catalog)
                {
                    spdlog::debug("Mirror status version {}, last check {}, {} mirrors",
                                  catalog->version,
                                  catalog->last_check,
                                  catalog->urls.size());
                }
                return catalog;
            }

            last_error = std::move(body.error());
            if (attempt < attempts)
            {
                spdlog::warn("{}, retrying in {} ms",
                             last_error.reason,
                             std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
                std::this_thread::sleep_for(wait);
                wait *= ctx.retry_backoff_factor;
            }
        }

        return tl::unexpected(MirrorupError::fatal(
            ErrorCode::MU_FETCH,
            fmt::format("Failed to fetch mirror status from `{}` after {} attempts: {}",
                        url,
                        attempts,
                        last_error.reason)));
    }
}

#ifndef MIRRORUP_STATUS_HPP
#define MIRRORUP_STATUS_HPP

#include <string>

#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/errors.hpp>
#include <mirrorup/mirror.hpp>

namespace mirrorup
{
    class Context;

    constexpr const char* DEFAULT_STATUS_URL = "https://archlinux.org/mirrors/status/json/";

    // MU_PARSE error if `text` is not a mirror status document.
    MIRRORUP_API tl::expected<MirrorCatalog, MirrorupError> parse_mirror_status(
        const std::string& text);

    /** Download and parse the mirror status document.
     * Transport errors and bad HTTP statuses are retried up to `ctx.status_fetch_attempts`
     * times, waiting `ctx.retry_default_timeout` multiplied by `ctx.retry_backoff_factor`
     * after each failure. Parse errors are returned right away.
     */
    MIRRORUP_API tl::expected<MirrorCatalog, MirrorupError> fetch_mirror_status(
        const Context& ctx, const std::string& url);
}

#endif

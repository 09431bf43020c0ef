#include <chrono>

#include <doctest/doctest.h>

#include <mirrorup/context.hpp>
#include <mirrorup/status.hpp>
#include <mirrorup/utils.hpp>

using namespace mirrorup;

namespace
{
    std::string testdata_url(const std::string& name)
    {
        return std::string("file://") + MIRRORUP_TEST_DATA_DIR + "/" + name;
    }
}

TEST_SUITE("status")
{
    TEST_CASE("fetch_file")
    {
        Context ctx;
        auto catalog = fetch_mirror_status(ctx, testdata_url("mirrors_status.json"));
        REQUIRE(catalog.has_value());
        CHECK_EQ(catalog->urls.size(), 9);
        CHECK_EQ(catalog->version, 3);
    }

    TEST_CASE("fetch_parse_error_not_retried")
    {
        Context ctx;
        ctx.status_fetch_attempts = 5;
        ctx.retry_default_timeout = std::chrono::seconds(2);

        const auto start = std::chrono::steady_clock::now();
        auto catalog = fetch_mirror_status(ctx, testdata_url("malformed_status.json"));
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(catalog.has_value());
        CHECK_EQ(catalog.error().code, ErrorCode::MU_PARSE);
        // a retry would have slept at least once
        CHECK(elapsed < std::chrono::seconds(2));
    }

    TEST_CASE("fetch_transport_error_retried")
    {
        Context ctx;
        ctx.status_fetch_attempts = 3;
        ctx.retry_default_timeout = std::chrono::milliseconds(10);
        ctx.retry_backoff_factor = 2;

        const auto start = std::chrono::steady_clock::now();
        auto catalog = fetch_mirror_status(ctx, testdata_url("does_not_exist.json"));
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(catalog.has_value());
        CHECK_EQ(catalog.error().code, ErrorCode::MU_FETCH);
        CHECK(catalog.error().is_fatal());
        CHECK(contains(catalog.error().reason, "after 3 attempts"));
        // 10 ms + 20 ms of backoff
        CHECK(elapsed >= std::chrono::milliseconds(30));
    }

    TEST_CASE("single_context")
    {
        Context ctx;
        CHECK_THROWS_AS(Context(), std::runtime_error);
    }
}

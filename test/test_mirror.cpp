#include <fstream>
#include <sstream>

#include <doctest/doctest.h>

#include <mirrorup/status.hpp>

using namespace mirrorup;

namespace
{
    std::string read_testdata(const std::string& name)
    {
        std::ifstream f(std::string(MIRRORUP_TEST_DATA_DIR) + "/" + name);
        std::stringstream buffer;
        buffer << f.rdbuf();
        return buffer.str();
    }
}

TEST_SUITE("mirror_status")
{
    TEST_CASE("parse")
    {
        auto catalog = parse_mirror_status(read_testdata("mirrors_status.json"));
        REQUIRE(catalog.has_value());

        CHECK_EQ(catalog->cutoff, 86400);
        CHECK_EQ(catalog->last_check, "2024-02-20T06:01:38.611Z");
        CHECK_EQ(catalog->num_checks, 24);
        CHECK_EQ(catalog->check_frequency, 3600);
        CHECK_EQ(catalog->version, 3);
        REQUIRE_EQ(catalog->urls.size(), 9);

        const auto& first = catalog->urls[0];
        CHECK_EQ(first.url, "https://mirror.one.example/archlinux/");
        CHECK_EQ(first.protocol, "https");
        CHECK_EQ(first.last_sync.value(), "2024-02-20T05:30:15Z");
        CHECK_EQ(first.completion_pct.value(), doctest::Approx(1.0));
        CHECK_EQ(first.delay.value(), 1200);
        CHECK_EQ(first.score.value(), doctest::Approx(1.5));
        CHECK(first.active);
        CHECK_EQ(first.country, "Germany");
        CHECK_EQ(first.country_code, "DE");
        CHECK(first.isos);
        CHECK(first.ipv6);
        CHECK_EQ(first.domain(), "mirror.one.example");

        // computed by the benchmark, never read from the document
        CHECK_FALSE(first.transfer_rate.has_value());
        CHECK_FALSE(first.weighted_score.has_value());
    }

    TEST_CASE("null_fields")
    {
        auto catalog = parse_mirror_status(read_testdata("mirrors_status.json"));
        REQUIRE(catalog.has_value());

        const auto& never = catalog->urls[7];
        CHECK_EQ(never.url, "https://mirror.never.example/archlinux/");
        CHECK_FALSE(never.last_sync.has_value());
        CHECK_FALSE(never.completion_pct.has_value());
        CHECK_FALSE(never.delay.has_value());
        CHECK_FALSE(never.duration_avg.has_value());
        CHECK_FALSE(never.score.has_value());
    }

    TEST_CASE("missing_optional_keys")
    {
        auto catalog = parse_mirror_status(
            R"({"urls": [{"url": "https://a.example/", "protocol": "https", "active": true}]})");
        REQUIRE(catalog.has_value());
        REQUIRE_EQ(catalog->urls.size(), 1);
        CHECK_FALSE(catalog->urls[0].delay.has_value());
        CHECK_EQ(catalog->urls[0].country, "");
    }

    TEST_CASE("malformed")
    {
        auto catalog = parse_mirror_status(read_testdata("malformed_status.json"));
        REQUIRE_FALSE(catalog.has_value());
        CHECK_EQ(catalog.error().code, ErrorCode::MU_PARSE);
        CHECK(catalog.error().is_fatal());
    }

    TEST_CASE("schema_mismatch")
    {
        auto no_urls = parse_mirror_status(R"({"cutoff": 1})");
        REQUIRE_FALSE(no_urls.has_value());
        CHECK_EQ(no_urls.error().code, ErrorCode::MU_PARSE);

        auto bad_delay = parse_mirror_status(
            R"({"urls": [{"url": "https://a.example/", "protocol": "https", "delay": "soon"}]})");
        REQUIRE_FALSE(bad_delay.has_value());
        CHECK_EQ(bad_delay.error().code, ErrorCode::MU_PARSE);
    }
}

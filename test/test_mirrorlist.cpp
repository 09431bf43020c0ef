#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

#include <doctest/doctest.h>

#include <mirrorup/mirrorlist.hpp>
#include <mirrorup/utils.hpp>

using namespace mirrorup;

namespace
{
    MirrorRecord evaluated_mirror(const std::string& url)
    {
        MirrorRecord m;
        m.url = url;
        m.protocol = "https";
        m.last_sync = "2024-02-20T05:30:15Z";
        m.completion_pct = 1.0;
        m.delay = 1200;
        m.score = 1.5;
        m.active = true;
        m.country = "Germany";
        m.country_code = "DE";
        m.isos = true;
        m.ipv4 = true;
        m.details = "https://archlinux.org/mirrors/one/";
        m.transfer_rate = 2048.0;
        m.weighted_score = 512.5;
        return m;
    }

    std::string read_file(const fs::path& path)
    {
        std::ifstream f(path);
        std::stringstream buffer;
        buffer << f.rdbuf();
        return buffer.str();
    }
}

TEST_SUITE("mirrorlist")
{
    TEST_CASE("server_line")
    {
        CHECK_EQ(to_pacman_mirror_list(evaluated_mirror("https://mirror.one.example/archlinux/")),
                 "Server = https://mirror.one.example/archlinux/$repo/os/$arch");
    }

    TEST_CASE("server_lines")
    {
        Mirrors mirrors = { evaluated_mirror("https://a.example/arch/"),
                            evaluated_mirror("http://b.example/") };
        const std::regex server_format(
            R"(Server\x20=\x20(http(s?))://(\S+\.\S+/)(\$repo/os/\$arch))");

        const auto list = to_pacman_mirror_list(mirrors);
        CHECK(ends_with(list, "\n"));
        auto lines = split(list.substr(0, list.size() - 1), "\n");
        REQUIRE_EQ(lines.size(), 2);
        for (const auto& line : lines)
        {
            CHECK(std::regex_match(line, server_format));
        }
        CHECK_EQ(to_pacman_mirror_list(Mirrors{}), "");
    }

    TEST_CASE("header")
    {
        const auto header = mirrorlist_header("https://archlinux.org/mirrors/status/json/");
        CHECK(starts_with(header, "#\n# /etc/pacman.d/mirrorlist\n"));
        CHECK(contains(header, "# source: https://archlinux.org/mirrors/status/json/\n"));
        CHECK(contains(header, "# when: "));
        CHECK(ends_with(header, "#\n\n"));
    }

    TEST_CASE("write_mirrorlist_file")
    {
        const fs::path path = fs::temp_directory_path() / "mirrorup_test_mirrorlist";
        fs::remove(path);

        Mirrors mirrors = { evaluated_mirror("https://a.example/arch/") };
        auto res = write_mirrorlist_file(path, mirrors, "https://source.example/json/");
        REQUIRE(res.has_value());

        const auto content = read_file(path);
        CHECK(starts_with(content, "#\n"));
        CHECK(ends_with(content, "\nServer = https://a.example/arch/$repo/os/$arch\n"));
        fs::remove(path);
    }

    TEST_CASE("write_to_bad_path")
    {
        auto res = write_csv("/nonexistent-directory/stats.csv", {});
        REQUIRE_FALSE(res.has_value());
        CHECK_EQ(res.error().code, ErrorCode::MU_IO);
    }

    TEST_CASE("csv")
    {
        auto complete = evaluated_mirror("https://a.example/arch/");
        MirrorRecord sparse;
        sparse.url = "https://b.example/";
        sparse.protocol = "https";
        sparse.country = "Korea, Republic of";
        sparse.details = "say \"hi\"";

        const auto csv = to_csv({ complete, sparse });
        auto lines = split(csv, "\n");
        REQUIRE_EQ(lines.size(), 4);
        CHECK_EQ(lines[0],
                 "url,protocol,last_sync,completion_pct,delay,duration_avg,duration_stddev,score,"
                 "active,country,country_code,isos,ipv4,ipv6,details,transfer_rate,weighted_score");
        CHECK_EQ(lines[1],
                 "https://a.example/arch/,https,2024-02-20T05:30:15Z,1,1200,,,1.5,true,Germany,DE,"
                 "true,true,false,https://archlinux.org/mirrors/one/,2048,512.5");
        CHECK_EQ(lines[2],
                 "https://b.example/,https,,,,,,,false,\"Korea, Republic of\",,false,false,false,"
                 "\"say \"\"hi\"\"\",,");
        CHECK_EQ(lines[3], "");
    }
}

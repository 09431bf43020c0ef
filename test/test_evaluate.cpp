#include <cmath>
#include <map>

#include <doctest/doctest.h>

#include <mirrorup/context.hpp>
#include <mirrorup/evaluate.hpp>
#include <mirrorup/filter.hpp>

using namespace mirrorup;

namespace
{
    MirrorRecord scored_mirror(const std::string& url,
                               std::optional<double> rate,
                               std::optional<double> score)
    {
        MirrorRecord m;
        m.url = url;
        m.protocol = "https";
        m.active = true;
        m.completion_pct = 1.0;
        m.delay = 60;
        m.transfer_rate = rate;
        m.score = score;
        return m;
    }

    // Rate function returning fixed rates by url, failing for unknown mirrors.
    probe_function fixed_rates(std::map<std::string, double> rates)
    {
        return [rates](const MirrorRecord& m,
                       TargetRepository) -> tl::expected<double, MirrorupError>
        {
            auto it = rates.find(m.url);
            if (it == rates.end())
            {
                return tl::unexpected(
                    MirrorupError{ ErrorLevel::INFO, ErrorCode::MU_PROBE, m.url + ": timeout" });
            }
            return it->second;
        };
    }
}

TEST_SUITE("evaluate")
{
    TEST_CASE("max_score")
    {
        CHECK_EQ(max_score({}), 0.0);
        CHECK_EQ(max_score({ scored_mirror("a", 1.0, std::nullopt) }), 0.0);
        CHECK_EQ(max_score({ scored_mirror("a", 1.0, 2.5),
                             scored_mirror("b", 1.0, std::nullopt),
                             scored_mirror("c", 1.0, 7.25) }),
                 7.25);
    }

    TEST_CASE("weighted_score")
    {
        Mirrors mirrors = { scored_mirror("a", 1000.0, 1.5),
                            scored_mirror("b", 2500.0, 4.0),
                            scored_mirror("c", std::nullopt, 2.0) };
        compute_weighted_scores(mirrors);

        const double max = 4.0;
        CHECK(std::abs(mirrors[0].weighted_score.value() - 1000.0 * (max - 1.5)) < 1e-9);
        CHECK(std::abs(mirrors[1].weighted_score.value() - 0.0) < 1e-9);
        // missing rate counts as 0
        CHECK(std::abs(mirrors[2].weighted_score.value() - 0.0) < 1e-9);
    }

    TEST_CASE("missing_score")
    {
        Mirrors mirrors = { scored_mirror("no-score", 5000.0, std::nullopt),
                            scored_mirror("slow", 10.0, 1.0),
                            scored_mirror("best", 100.0, 0.5),
                            scored_mirror("worst", 100.0, 2.0) };
        compute_weighted_scores(mirrors);
        CHECK_FALSE(mirrors[0].weighted_score.has_value());

        sort_by_weighted_score(mirrors);
        CHECK_EQ(mirrors[0].url, "best");
        CHECK_EQ(mirrors[1].url, "slow");
        CHECK_EQ(mirrors[2].url, "worst");
        CHECK_EQ(mirrors[3].url, "no-score");
    }

    TEST_CASE("sort_is_stable")
    {
        Mirrors mirrors = { scored_mirror("first", std::nullopt, 1.0),
                            scored_mirror("second", std::nullopt, 3.0),
                            scored_mirror("fast", 50.0, 1.0),
                            scored_mirror("third", std::nullopt, 2.0) };
        compute_weighted_scores(mirrors);
        sort_by_weighted_score(mirrors);

        CHECK_EQ(mirrors[0].url, "fast");
        CHECK_EQ(mirrors[1].url, "first");
        CHECK_EQ(mirrors[2].url, "second");
        CHECK_EQ(mirrors[3].url, "third");

        for (std::size_t n = 1; n < mirrors.size(); ++n)
        {
            CHECK(mirrors[n - 1].weighted_score.value() >= mirrors[n].weighted_score.value());
        }
    }

    TEST_CASE("select_mirrors")
    {
        Mirrors mirrors = { scored_mirror("a", 1.0, 1.0), scored_mirror("b", 1.0, 1.0) };
        select_mirrors(mirrors, 5);
        CHECK_EQ(mirrors.size(), 2);
        select_mirrors(mirrors, 1);
        REQUIRE_EQ(mirrors.size(), 1);
        CHECK_EQ(mirrors[0].url, "a");
    }

    TEST_CASE("evaluate_selects_best")
    {
        Mirrors mirrors = { scored_mirror("https://a.example/", std::nullopt, 3.0),
                            scored_mirror("https://b.example/", std::nullopt, 1.0),
                            scored_mirror("https://c.example/", std::nullopt, 2.0),
                            scored_mirror("https://down.example/", std::nullopt, 0.1) };
        auto result = evaluate(mirrors,
                               2,
                               TargetRepository::kCORE,
                               fixed_rates({ { "https://a.example/", 1000.0 },
                                             { "https://b.example/", 100.0 },
                                             { "https://c.example/", 300.0 } }));
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->size(), 2);

        // max score is 3.0: a -> 0, b -> 200, c -> 300, down -> 0
        CHECK_EQ(result->at(0).url, "https://c.example/");
        CHECK(std::abs(result->at(0).weighted_score.value() - 300.0) < 1e-9);
        CHECK_EQ(result->at(1).url, "https://b.example/");
        CHECK(std::abs(result->at(1).weighted_score.value() - 200.0) < 1e-9);
        CHECK_EQ(result->at(1).transfer_rate.value(), 100.0);
    }

    TEST_CASE("evaluate_bound")
    {
        Mirrors mirrors = { scored_mirror("https://a.example/", std::nullopt, 1.0),
                            scored_mirror("https://b.example/", std::nullopt, 2.0) };
        for (std::size_t n : { 1, 2, 10 })
        {
            auto result = evaluate(mirrors, n, TargetRepository::kCORE, fixed_rates({}));
            REQUIRE(result.has_value());
            CHECK(result->size() <= n);
        }
    }

    TEST_CASE("evaluate_empty")
    {
        auto none = evaluate(Mirrors{}, 10, TargetRepository::kCORE, fixed_rates({}));
        REQUIRE_FALSE(none.has_value());
        CHECK_EQ(none.error().code, ErrorCode::MU_NOBESTMIRRORS);
        CHECK(none.error().is_fatal());

        Mirrors one = { scored_mirror("https://a.example/", std::nullopt, 1.0) };
        auto zero = evaluate(one, 0, TargetRepository::kCORE, fixed_rates({}));
        REQUIRE_FALSE(zero.has_value());
        CHECK_EQ(zero.error().code, ErrorCode::MU_NOBESTMIRRORS);
    }

    TEST_CASE("end_to_end_equal_scores")
    {
        MirrorCatalog catalog;
        auto fast = scored_mirror("https://fast.example/", std::nullopt, 1.0);
        fast.delay = 100;
        auto slow = scored_mirror("https://slow.example/", std::nullopt, 1.0);
        slow.delay = 200;
        auto stale = scored_mirror("https://stale.example/", std::nullopt, 0.2);
        stale.delay = 7200;
        catalog.urls = { slow, stale, fast };

        auto synced = best_synced_mirrors(catalog, 0);
        REQUIRE(synced.has_value());
        REQUIRE_EQ(synced->size(), 2);

        auto best = evaluate(synced.value(),
                             2,
                             TargetRepository::kEXTRA,
                             fixed_rates({ { "https://slow.example/", 20.0 },
                                           { "https://fast.example/", 10.0 } }));
        REQUIRE(best.has_value());
        REQUIRE_EQ(best->size(), 2);

        // Both scores equal max_score, so both weights are 0 whatever the rates and the
        // stable sort keeps the delay order: the lower delay wins, not the higher rate.
        CHECK_EQ(best->at(0).weighted_score.value(), 0.0);
        CHECK_EQ(best->at(1).weighted_score.value(), 0.0);
        CHECK_EQ(best->at(0).url, "https://fast.example/");
        CHECK_EQ(best->at(0).transfer_rate.value(), 10.0);
        CHECK_EQ(best->at(1).url, "https://slow.example/");
        CHECK_EQ(best->at(1).transfer_rate.value(), 20.0);
    }

    TEST_CASE("end_to_end_rates_decide")
    {
        MirrorCatalog catalog;
        auto near = scored_mirror("https://near.example/", std::nullopt, 2.0);
        near.delay = 100;
        auto far = scored_mirror("https://far.example/", std::nullopt, 1.0);
        far.delay = 200;
        auto ref = scored_mirror("https://ref.example/", std::nullopt, 4.0);
        ref.delay = 300;
        catalog.urls = { far, ref, near };

        auto synced = best_synced_mirrors(catalog, 0);
        REQUIRE(synced.has_value());

        // max score 4.0: near -> 10 * 2 = 20, far -> 30 * 3 = 90, ref -> 0
        auto best = evaluate(synced.value(),
                             1,
                             TargetRepository::kEXTRA,
                             fixed_rates({ { "https://near.example/", 10.0 },
                                           { "https://far.example/", 30.0 },
                                           { "https://ref.example/", 50.0 } }));
        REQUIRE(best.has_value());
        REQUIRE_EQ(best->size(), 1);
        CHECK_EQ(best->at(0).url, "https://far.example/");
        CHECK(std::abs(best->at(0).weighted_score.value() - 90.0) < 1e-9);
    }

    TEST_CASE("evaluate_on_pool")
    {
        Context ctx;
        ProbePool pool(ctx, 2);

        Mirrors mirrors
            = { scored_mirror("file:///mirrorup-does-not-exist/", std::nullopt, 1.0),
                scored_mirror(std::string("file://") + MIRRORUP_TEST_DATA_DIR + "/",
                              std::nullopt,
                              1.0),
                scored_mirror("file:///mirrorup-does-not-exist/ref/", std::nullopt, 3.0) };

        auto best = evaluate(mirrors, 2, TargetRepository::kEXTRA, pool);
        REQUIRE(best.has_value());
        REQUIRE_EQ(best->size(), 2);
        // only the local mirror has a rate, its weight is rate * (3 - 1)
        CHECK_EQ(best->at(0).url, mirrors[1].url);
        CHECK(best->at(0).weighted_score.value() > 0.0);
        CHECK_EQ(best->at(1).url, mirrors[0].url);
        CHECK_FALSE(best->at(1).transfer_rate.has_value());
        CHECK_EQ(best->at(1).weighted_score.value(), 0.0);
    }
}

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorup/evaluate.hpp>

namespace mirrorup
{
    double max_score(const Mirrors& mirrors)
    {
        double max = 0.0;
        bool found = false;
        for (const auto& m : mirrors)
        {
            if (m.score && (!found || m.score.value() > max))
            {
                max = m.score.value();
                found = true;
            }
        }
        return max;
    }

    void compute_weighted_scores(Mirrors& mirrors)
    {
        const double max = max_score(mirrors);
        for (auto& m : mirrors)
        {
            const double rate = m.transfer_rate.value_or(0.0);
            const double score = m.score.value_or(std::numeric_limits<double>::quiet_NaN());
            const double weighted = rate * (max - score);
            if (std::isnan(weighted))
            {
                m.weighted_score = std::nullopt;
            }
            else
            {
                m.weighted_score = weighted;
            }
        }
    }

    void sort_by_weighted_score(Mirrors& mirrors)
    {
        std::stable_sort(mirrors.begin(),
                         mirrors.end(),
                         [](const MirrorRecord& a, const MirrorRecord& b)
                         {
                             if (!a.weighted_score)
                                 return false;
                             if (!b.weighted_score)
                                 return true;
                             return a.weighted_score.value() > b.weighted_score.value();
                         });
    }

    void select_mirrors(Mirrors& mirrors, std::size_t n)
    {
        if (mirrors.size() > n)
        {
            mirrors.resize(n);
        }
    }

    namespace
    {
        tl::expected<Mirrors, MirrorupError> rank(Mirrors mirrors,
                                                  std::size_t n,
                                                  const std::vector<MirrorupError>& failures)
        {
            if (!failures.empty())
            {
                spdlog::info("{} of {} mirrors could not be benchmarked",
                             failures.size(),
                             mirrors.size());
            }

            compute_weighted_scores(mirrors);
            sort_by_weighted_score(mirrors);
            select_mirrors(mirrors, n);

            if (mirrors.empty())
            {
                return tl::unexpected(
                    MirrorupError::fatal(ErrorCode::MU_NOBESTMIRRORS, "No best mirrors"));
            }
            return mirrors;
        }
    }

    tl::expected<Mirrors, MirrorupError> evaluate(Mirrors mirrors,
                                                  std::size_t n,
                                                  TargetRepository repo,
                                                  ProbePool& pool)
    {
        const auto failures = pool.run(mirrors, repo);
        return rank(std::move(mirrors), n, failures);
    }

    tl::expected<Mirrors, MirrorupError> evaluate(Mirrors mirrors,
                                                  std::size_t n,
                                                  TargetRepository repo,
                                                  const probe_function& probe)
    {
        const auto failures = probe_all(mirrors, repo, probe);
        return rank(std::move(mirrors), n, failures);
    }
}

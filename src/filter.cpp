#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorup/filter.hpp>

namespace mirrorup
{
    bool is_synced(const MirrorRecord& mirror)
    {
        if (!mirror.active)
            return false;

        if (mirror.protocol != "http" && mirror.protocol != "https")
            return false;

        if (!mirror.completion_pct
            || std::abs(mirror.completion_pct.value() - 1.0)
                   >= std::numeric_limits<double>::epsilon())
            return false;

        return mirror.delay && mirror.delay.value() < MAX_SYNC_DELAY;
    }

    tl::expected<Mirrors, MirrorupError> best_synced_mirrors(const MirrorCatalog& catalog,
                                                             std::size_t max_check,
                                                             const ExcludedMirrors* excluded)
    {
        Mirrors mirrors;
        for (const auto& m : catalog.urls)
        {
            if (!is_synced(m))
                continue;

            if (excluded && excluded->is_excluded(m))
            {
                spdlog::debug("Excluded mirror {}", m.url);
                continue;
            }
            mirrors.push_back(m);
        }

        std::stable_sort(mirrors.begin(),
                         mirrors.end(),
                         [](const MirrorRecord& a, const MirrorRecord& b)
                         { return a.delay.value() < b.delay.value(); });

        if (max_check > 0 && mirrors.size() > max_check)
        {
            mirrors.resize(max_check);
        }

        if (mirrors.empty())
        {
            return tl::unexpected(MirrorupError::fatal(
                ErrorCode::MU_NOCANDIDATES,
                fmt::format("No best synced mirrors out of {} mirrors", catalog.urls.size())));
        }

        spdlog::info("{} synced mirrors out of {} selected for benchmark",
                     mirrors.size(),
                     catalog.urls.size());
        return mirrors;
    }
}

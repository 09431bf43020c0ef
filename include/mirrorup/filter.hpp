#ifndef MIRRORUP_FILTER_HPP
#define MIRRORUP_FILTER_HPP

#include <cstddef>

#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/errors.hpp>
#include <mirrorup/exclude.hpp>
#include <mirrorup/mirror.hpp>

namespace mirrorup
{
    // Mirrors lagging this many seconds or more behind the upstream are dropped.
    constexpr long long MAX_SYNC_DELAY = 3600;

    // active, http(s), fully synced and less than MAX_SYNC_DELAY behind.
    MIRRORUP_API bool is_synced(const MirrorRecord& mirror);

    /** Select the mirrors worth benchmarking.
     * Keeps synced mirrors that are not excluded, sorted by delay (stable),
     * and truncated to `max_check` entries unless `max_check` is 0.
     * @param excluded  rule set to apply, or nullptr for none
     * @return          MU_NOCANDIDATES error if nothing is left
     */
    MIRRORUP_API tl::expected<Mirrors, MirrorupError> best_synced_mirrors(
        const MirrorCatalog& catalog,
        std::size_t max_check,
        const ExcludedMirrors* excluded = nullptr);
}

#endif

#ifndef MIRRORUP_EVALUATE_HPP
#define MIRRORUP_EVALUATE_HPP

#include <cstddef>

#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/enums.hpp>
#include <mirrorup/errors.hpp>
#include <mirrorup/mirror.hpp>
#include <mirrorup/probe.hpp>

namespace mirrorup
{
    // Highest upstream score of `mirrors`, 0.0 if none has a score.
    MIRRORUP_API double max_score(const Mirrors& mirrors);

    // weighted_score = transfer_rate * (max_score - score).
    // A missing rate counts as 0, a missing score leaves weighted_score unset.
    MIRRORUP_API void compute_weighted_scores(Mirrors& mirrors);

    // Descending and stable, mirrors without weighted score go last.
    MIRRORUP_API void sort_by_weighted_score(Mirrors& mirrors);

    MIRRORUP_API void select_mirrors(Mirrors& mirrors, std::size_t n);

    /** Returns the n best mirrors.
     * Benchmarks all `mirrors` on `pool`, scores, sorts and keeps n.
     * @return  MU_NOBESTMIRRORS error if the selection is empty
     */
    MIRRORUP_API tl::expected<Mirrors, MirrorupError> evaluate(Mirrors mirrors,
                                                               std::size_t n,
                                                               TargetRepository repo,
                                                               ProbePool& pool);

    // Same as above, measuring each mirror with `probe` instead.
    MIRRORUP_API tl::expected<Mirrors, MirrorupError> evaluate(Mirrors mirrors,
                                                               std::size_t n,
                                                               TargetRepository repo,
                                                               const probe_function& probe);
}

#endif

#ifndef MIRRORUP_ENUMS_HPP
#define MIRRORUP_ENUMS_HPP

#include <optional>
#include <string>
#include <string_view>

#include <mirrorup/export.hpp>

namespace mirrorup
{
    // Package database fetched from every mirror to measure its transfer rate.
    enum class TargetRepository
    {
        kCORE,
        kEXTRA,
        kCOMMUNITY,
        kMULTILIB,
    };

    MIRRORUP_API std::string to_string(TargetRepository repo);

    // Case-insensitive, returns nullopt for an unknown repository name.
    MIRRORUP_API std::optional<TargetRepository> target_repository_from_string(
        std::string_view name);

    // Path of the database file relative to a mirror base url,
    // e.g. "extra/os/x86_64/extra.db"
    MIRRORUP_API std::string database_path(TargetRepository repo);

    enum class ErrorCode
    {
        // everything is ok
        MU_OK,
        // the mirror status document could not be retrieved (transport error, bad status)
        MU_FETCH,
        // the mirror status document is not valid JSON or does not match the schema
        MU_PARSE,
        // no mirror survived the sync filter and the exclusion rules
        MU_NOCANDIDATES,
        // a single mirror could not be benchmarked
        MU_PROBE,
        // nothing left after scoring and selection
        MU_NOBESTMIRRORS,
        // bad configuration (unreadable rule file, existing output file, bad config file, ...)
        MU_CONFIG,
        // input output error while writing results
        MU_IO,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };
}

#endif

#ifndef MIRRORUP_RUN_HPP
#define MIRRORUP_RUN_HPP

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/context.hpp>
#include <mirrorup/errors.hpp>
#include <mirrorup/exclude.hpp>
#include <mirrorup/status.hpp>

namespace mirrorup
{
    namespace fs = std::filesystem;

    struct MIRRORUP_API RunOptions
    {
        std::string source_url = DEFAULT_STATUS_URL;
        std::string target_db = "extra";
        std::string output_file;
        std::string stats_file;
        std::size_t mirrors = 10;
        std::size_t max_check = 100;
        std::size_t threads = 5;
        std::vector<std::string> exclude;
        std::string exclude_from;
        long connect_timeout = 30L;
        long probe_timeout = 10L;
        // Only used for the status fetch, benchmark transfers never go through a proxy.
        proxy_map_type proxies;
    };

    /** Reads a YAML configuration file into `options`.
     * Keys listed in `given` were set on the command line and are left untouched.
     * An empty file is accepted.
     * @return  MU_CONFIG error if the file cannot be read, is not a mapping or
     *          holds a value of the wrong type
     */
    MIRRORUP_API tl::expected<void, MirrorupError> load_config(const fs::path& path,
                                                               RunOptions& options,
                                                               const std::set<std::string>& given
                                                               = {});

    // MU_CONFIG error if `path` is set and already exists.
    MIRRORUP_API tl::expected<void, MirrorupError> check_output_file(const std::string& path);

    // Rules of `exclude_from` first, then the `exclude` literals, so that the literals win.
    MIRRORUP_API tl::expected<ExcludedMirrors, MirrorupError> load_exclusions(
        const RunOptions& options);

    /** Fetch, filter, benchmark, select and write the result.
     * The mirror list goes to `output_file` when set, to `out` otherwise.
     * Option errors are reported before any transfer is started.
     */
    MIRRORUP_API tl::expected<void, MirrorupError> run(Context& ctx,
                                                       const RunOptions& options,
                                                       std::FILE* out = stdout);
}

#endif

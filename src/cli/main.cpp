#include <csignal>
#include <set>
#include <string>
#include <utility>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mirrorup/context.hpp>
#include <mirrorup/mirrorup.hpp>
#include <mirrorup/run.hpp>

using namespace mirrorup;

namespace
{
    // YAML key of every option that may also come from the configuration file.
    const std::pair<const char*, const char*> CONFIG_OPTIONS[] = {
        { "source_url", "--source-url" },     { "target_db", "--target-db" },
        { "output_file", "--output-file" },   { "stats_file", "--stats-file" },
        { "mirrors", "--mirrors" },           { "max_check", "--max-check" },
        { "threads", "--threads" },           { "exclude", "--exclude" },
        { "exclude_from", "--exclude-from" },
    };

    std::set<std::string> given_on_command_line(const CLI::App& app)
    {
        std::set<std::string> given;
        for (const auto& [key, option] : CONFIG_OPTIONS)
        {
            if (app.count(option) > 0)
                given.insert(key);
        }
        return given;
    }
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Retrieve the best and latest Pacman mirror list based on user's geography" };

    RunOptions options;
    std::string config_file;
    int verbose = 0;
    bool quiet = false;

    app.add_option("-S,--source-url", options.source_url, "Arch Linux mirrors status's data source")
        ->capture_default_str();
    app.add_option("-t,--target-db",
                   options.target_db,
                   "Speed test target database file (core, extra, community or multilib)")
        ->capture_default_str();
    app.add_option("-o,--output-file", options.output_file, "Mirror list output file");
    app.add_option(
           "-m,--mirrors", options.mirrors, "Limit the list to the n mirrors with the highest score")
        ->capture_default_str();
    app.add_option("--max-check",
                   options.max_check,
                   "Limit the number of synced mirrors to benchmark, 0 means no limit")
        ->capture_default_str();
    app.add_option("-T,--threads",
                   options.threads,
                   "The maximum number of parallel transfers when measuring transfer rate")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("-s,--stats-file", options.stats_file, "Statistics output file");
    app.add_option("--exclude",
                   options.exclude,
                   "Exclude a mirror: domain, domain=X, country=X or country_code=X, '!' negates");
    app.add_option("--exclude-from", options.exclude_from, "Read exclusion rules from a file");
    app.add_option("-c,--config", config_file, "YAML configuration file");
    app.add_flag("-v,--verbose", verbose, "Increase verbosity (repeatable)");
    app.add_flag("-q,--quiet", quiet, "Only report errors");
    app.set_version_flag("-V,--version", MIRRORUP_VERSION_STRING);

    CLI11_PARSE(app, argc, argv);

    // a closed stdout pipe is reported through EPIPE instead of killing the process
    std::signal(SIGPIPE, SIG_IGN);

    spdlog::set_default_logger(spdlog::stderr_color_mt("mirrorup"));
    spdlog::set_pattern("%^%l%$ %v");

    try
    {
        Context ctx;
        ctx.set_verbosity(quiet ? -1 : verbose);

        if (!config_file.empty())
        {
            spdlog::info("Loading file {}", config_file);
            auto loaded = load_config(config_file, options, given_on_command_line(app));
            if (!loaded)
            {
                loaded.error().log();
                return 1;
            }
        }

        auto result = run(ctx, options);
        if (!result)
        {
            result.error().log();
            return 1;
        }
    }
    catch (const std::exception& e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }
    return 0;
}

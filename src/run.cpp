#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <mirrorup/evaluate.hpp>
#include <mirrorup/filter.hpp>
#include <mirrorup/mirrorlist.hpp>
#include <mirrorup/probe.hpp>
#include <mirrorup/run.hpp>

namespace mirrorup
{
    namespace
    {
        template <class T>
        void read_key(const YAML::Node& config,
                      const std::string& key,
                      const std::set<std::string>& given,
                      T& value)
        {
            if (config[key] && given.count(key) == 0)
            {
                value = config[key].as<T>();
            }
        }
    }

    tl::expected<void, MirrorupError> load_config(const fs::path& path,
                                                  RunOptions& options,
                                                  const std::set<std::string>& given)
    {
        try
        {
            YAML::Node config = YAML::LoadFile(path.string());
            if (config.IsNull())
            {
                return {};
            }
            if (!config.IsMap())
            {
                return tl::unexpected(MirrorupError::fatal(
                    ErrorCode::MU_CONFIG,
                    fmt::format("`{}` is not a YAML mapping", path.string())));
            }

            read_key(config, "source_url", given, options.source_url);
            read_key(config, "target_db", given, options.target_db);
            read_key(config, "output_file", given, options.output_file);
            read_key(config, "stats_file", given, options.stats_file);
            read_key(config, "mirrors", given, options.mirrors);
            read_key(config, "max_check", given, options.max_check);
            read_key(config, "threads", given, options.threads);
            read_key(config, "exclude", given, options.exclude);
            read_key(config, "exclude_from", given, options.exclude_from);
            read_key(config, "connect_timeout", given, options.connect_timeout);
            read_key(config, "probe_timeout", given, options.probe_timeout);
            read_key(config, "proxies", given, options.proxies);
        }
        catch (const YAML::Exception& e)
        {
            return tl::unexpected(MirrorupError::fatal(
                ErrorCode::MU_CONFIG,
                fmt::format(
                    "Could not load configuration file `{}`: {}", path.string(), e.what())));
        }
        return {};
    }

    tl::expected<void, MirrorupError> check_output_file(const std::string& path)
    {
        if (!path.empty() && fs::exists(path))
        {
            return tl::unexpected(
                MirrorupError::fatal(ErrorCode::MU_CONFIG, fmt::format("`{}` is exist.", path)));
        }
        return {};
    }

    tl::expected<ExcludedMirrors, MirrorupError> load_exclusions(const RunOptions& options)
    {
        ExcludedMirrors excluded;
        if (!options.exclude_from.empty())
        {
            auto added = excluded.add_from(options.exclude_from);
            if (!added)
                return tl::unexpected(added.error());
        }
        for (const auto& literal : options.exclude)
        {
            excluded.add(literal);
        }
        for (const auto& rule : excluded.rules())
        {
            spdlog::debug("Exclusion rule: {}", rule.to_string());
        }
        return excluded;
    }

    tl::expected<void, MirrorupError> run(Context& ctx, const RunOptions& options, std::FILE* out)
    {
        const auto repo = target_repository_from_string(options.target_db);
        if (!repo)
        {
            return tl::unexpected(MirrorupError::fatal(
                ErrorCode::MU_CONFIG,
                fmt::format("Unknown target database `{}`", options.target_db)));
        }

        for (const auto& path : { options.output_file, options.stats_file })
        {
            auto checked = check_output_file(path);
            if (!checked)
                return checked;
        }

        auto excluded = load_exclusions(options);
        if (!excluded)
            return tl::unexpected(excluded.error());

        ctx.connect_timeout = options.connect_timeout;
        ctx.probe_timeout = options.probe_timeout;
        if (!options.proxies.empty())
            ctx.proxy_map = options.proxies;

        auto catalog = fetch_mirror_status(ctx, options.source_url);
        if (!catalog)
            return tl::unexpected(catalog.error());

        auto synced = best_synced_mirrors(catalog.value(),
                                          options.max_check,
                                          excluded->empty() ? nullptr : &excluded.value());
        if (!synced)
            return tl::unexpected(synced.error());

        ProbePool pool(ctx, options.threads);
        auto best = evaluate(std::move(synced.value()), options.mirrors, repo.value(), pool);
        if (!best)
            return tl::unexpected(best.error());

        if (!options.stats_file.empty())
        {
            auto written = write_csv(options.stats_file, best.value());
            if (!written)
                return written;
        }

        if (!options.output_file.empty())
        {
            return write_mirrorlist_file(options.output_file, best.value(), options.source_url);
        }
        return write_mirrorlist(out, best.value());
    }
}

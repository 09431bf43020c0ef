#ifndef MIRRORUP_MIRROR_HPP
#define MIRRORUP_MIRROR_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <mirrorup/export.hpp>

namespace mirrorup
{
    // One entry of the mirror status document.
    struct MIRRORUP_API MirrorRecord
    {
        std::string url;
        std::string protocol;
        std::optional<std::string> last_sync;
        // fraction in [0.0, 1.0]
        std::optional<double> completion_pct;
        // seconds behind the upstream
        std::optional<long long> delay;
        std::optional<double> duration_avg;
        std::optional<double> duration_stddev;
        // upstream quality score, lower is better
        std::optional<double> score;
        bool active = false;
        std::string country;
        std::string country_code;
        bool isos = false;
        bool ipv4 = false;
        bool ipv6 = false;
        std::string details;

        // Computed by the benchmark, bytes per second.
        std::optional<double> transfer_rate;
        // Computed by the evaluation, higher is better.
        std::optional<double> weighted_score;

        // Lowercase host of the url.
        std::string domain() const;
    };

    using Mirrors = std::vector<MirrorRecord>;

    // The whole mirror status document. Everything besides `urls` is informational.
    struct MIRRORUP_API MirrorCatalog
    {
        long long cutoff = 0;
        std::string last_check;
        long long num_checks = 0;
        long long check_frequency = 0;
        Mirrors urls;
        long long version = 0;
    };

    // Throws nlohmann::json::exception when `j` does not match the schema.
    MIRRORUP_API void from_json(const nlohmann::json& j, MirrorRecord& m);
    MIRRORUP_API void from_json(const nlohmann::json& j, MirrorCatalog& c);
}

#endif

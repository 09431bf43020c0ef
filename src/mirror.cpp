#include <mirrorup/mirror.hpp>
#include <mirrorup/utils.hpp>

namespace mirrorup
{
    namespace
    {
        // null and missing keys are both "absent"
        template <class T>
        void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                out = std::nullopt;
            }
            else
            {
                out = it->get<T>();
            }
        }

        template <class T>
        void get_or_default(const nlohmann::json& j, const char* key, T& out)
        {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null())
            {
                it->get_to(out);
            }
        }
    }

    std::string MirrorRecord::domain() const
    {
        return url_host(url);
    }

    void from_json(const nlohmann::json& j, MirrorRecord& m)
    {
        j.at("url").get_to(m.url);
        j.at("protocol").get_to(m.protocol);
        get_optional(j, "last_sync", m.last_sync);
        get_optional(j, "completion_pct", m.completion_pct);
        get_optional(j, "delay", m.delay);
        get_optional(j, "duration_avg", m.duration_avg);
        get_optional(j, "duration_stddev", m.duration_stddev);
        get_optional(j, "score", m.score);
        get_or_default(j, "active", m.active);
        get_or_default(j, "country", m.country);
        get_or_default(j, "country_code", m.country_code);
        get_or_default(j, "isos", m.isos);
        get_or_default(j, "ipv4", m.ipv4);
        get_or_default(j, "ipv6", m.ipv6);
        get_or_default(j, "details", m.details);

        m.transfer_rate = std::nullopt;
        m.weighted_score = std::nullopt;
    }

    void from_json(const nlohmann::json& j, MirrorCatalog& c)
    {
        get_or_default(j, "cutoff", c.cutoff);
        get_or_default(j, "last_check", c.last_check);
        get_or_default(j, "num_checks", c.num_checks);
        get_or_default(j, "check_frequency", c.check_frequency);
        get_or_default(j, "version", c.version);
        c.urls = j.at("urls").get<Mirrors>();
    }
}

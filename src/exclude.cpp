#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorup/exclude.hpp>
#include <mirrorup/utils.hpp>

namespace mirrorup
{
    namespace
    {
        const char* kind_name(ExcludeKind kind)
        {
            switch (kind)
            {
                case ExcludeKind::kDOMAIN:
                    return "domain";
                case ExcludeKind::kCOUNTRY:
                    return "country";
                case ExcludeKind::kCOUNTRY_CODE:
                    return "country_code";
            }
            return "domain";
        }

        std::optional<ExcludeKind> kind_from_keyword(std::string_view keyword)
        {
            for (auto kind :
                 { ExcludeKind::kDOMAIN, ExcludeKind::kCOUNTRY, ExcludeKind::kCOUNTRY_CODE })
            {
                if (keyword == kind_name(kind))
                    return kind;
            }
            return std::nullopt;
        }
    }

    std::string ExclusionRule::to_string() const
    {
        return fmt::format("{}{}={}", negate ? "!" : "", kind_name(kind), value);
    }

    std::optional<ExclusionRule> parse_exclude_rule(std::string_view line)
    {
        auto comment = line.find_first_of("#;");
        if (comment != std::string_view::npos)
        {
            line = line.substr(0, comment);
        }

        const std::string lline = to_lower(strip(line));
        std::string_view rest = lline;
        if (rest.empty())
        {
            return std::nullopt;
        }

        ExclusionRule rule;
        if (rest.front() == '!')
        {
            rule.negate = true;
            rest = strip(rest.substr(1));
        }

        auto eq = rest.find('=');
        std::optional<ExcludeKind> kind;
        if (eq != std::string_view::npos)
        {
            kind = kind_from_keyword(strip(rest.substr(0, eq)));
        }

        if (kind)
        {
            rule.kind = kind.value();
            rule.value = std::string(strip(rest.substr(eq + 1)));
        }
        else
        {
            // no keyword, the whole token is a domain
            rule.kind = ExcludeKind::kDOMAIN;
            rule.value = std::string(rest);
        }

        if (rule.value.empty())
        {
            return std::nullopt;
        }
        return rule;
    }

    void ExcludedMirrors::add(ExclusionRule rule)
    {
        m_rules.push_back(std::move(rule));
    }

    void ExcludedMirrors::add(std::string_view line)
    {
        auto rule = parse_exclude_rule(line);
        if (rule)
        {
            add(std::move(rule.value()));
        }
    }

    tl::expected<void, MirrorupError> ExcludedMirrors::add_from(const fs::path& file)
    {
        std::ifstream in(file);
        if (!in)
        {
            return tl::unexpected(MirrorupError::fatal(
                ErrorCode::MU_CONFIG,
                fmt::format("Could not open excluded mirror file `{}`", file.string())));
        }

        std::string line;
        while (std::getline(in, line))
        {
            add(line);
        }

        if (in.bad())
        {
            return tl::unexpected(MirrorupError::fatal(
                ErrorCode::MU_CONFIG,
                fmt::format("Could not read excluded mirror file `{}`", file.string())));
        }
        return {};
    }

    bool ExcludedMirrors::is_excluded(const MirrorRecord& mirror) const
    {
        return mirrorup::is_excluded(mirror, m_rules);
    }

    bool is_excluded(const MirrorRecord& mirror, const std::vector<ExclusionRule>& rules)
    {
        if (rules.empty())
            return false;

        const std::string domain = mirror.domain();
        const std::string country = to_lower(mirror.country);
        const std::string country_code = to_lower(mirror.country_code);

        // the last matching rule wins
        for (auto it = rules.rbegin(); it != rules.rend(); ++it)
        {
            const std::string* key = nullptr;
            switch (it->kind)
            {
                case ExcludeKind::kDOMAIN:
                    key = &domain;
                    break;
                case ExcludeKind::kCOUNTRY:
                    key = &country;
                    break;
                case ExcludeKind::kCOUNTRY_CODE:
                    key = &country_code;
                    break;
            }

            if (key && !key->empty() && *key == it->value)
            {
                spdlog::debug("Mirror {} matches exclusion rule `{}`", mirror.url, it->to_string());
                return !it->negate;
            }
        }
        return false;
    }
}

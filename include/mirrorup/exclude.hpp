#ifndef MIRRORUP_EXCLUDE_HPP
#define MIRRORUP_EXCLUDE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/errors.hpp>
#include <mirrorup/mirror.hpp>

namespace mirrorup
{
    namespace fs = std::filesystem;

    enum class ExcludeKind
    {
        kDOMAIN,
        kCOUNTRY,
        kCOUNTRY_CODE,
    };

    struct MIRRORUP_API ExclusionRule
    {
        ExcludeKind kind = ExcludeKind::kDOMAIN;
        // always lowercase
        std::string value;
        // a negated rule keeps a mirror that an earlier rule would exclude
        bool negate = false;

        std::string to_string() const;

        [[nodiscard]] friend bool operator==(const ExclusionRule& left, const ExclusionRule& right)
        {
            return left.kind == right.kind && left.value == right.value
                   && left.negate == right.negate;
        }
    };

    /** Parse one line of an exclusion file or one --exclude literal.
     *
     *  [!] ( bare-domain | domain = X | country = X | country_code = X )
     *
     * Everything after '#' or ';' is a comment, the line is compared lowercase.
     * Returns nullopt for blank and comment-only lines.
     */
    MIRRORUP_API std::optional<ExclusionRule> parse_exclude_rule(std::string_view line);

    // Ordered rule set. The last rule matching a mirror decides whether it is excluded.
    class MIRRORUP_API ExcludedMirrors
    {
    public:
        void add(ExclusionRule rule);

        // Parses `line`, ignores blank and comment lines.
        void add(std::string_view line);

        tl::expected<void, MirrorupError> add_from(const fs::path& file);

        bool is_excluded(const MirrorRecord& mirror) const;

        const std::vector<ExclusionRule>& rules() const noexcept
        {
            return m_rules;
        }

        bool empty() const noexcept
        {
            return m_rules.empty();
        }

    private:
        std::vector<ExclusionRule> m_rules;
    };

    MIRRORUP_API bool is_excluded(const MirrorRecord& mirror,
                                  const std::vector<ExclusionRule>& rules);
}

#endif

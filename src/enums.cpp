#include <fmt/format.h>

#include <mirrorup/enums.hpp>
#include <mirrorup/utils.hpp>

namespace mirrorup
{
    std::string to_string(TargetRepository repo)
    {
        switch (repo)
        {
            case TargetRepository::kCORE:
                return "core";
            case TargetRepository::kEXTRA:
                return "extra";
            case TargetRepository::kCOMMUNITY:
                return "community";
            case TargetRepository::kMULTILIB:
                return "multilib";
        }
        return "extra";
    }

    std::optional<TargetRepository> target_repository_from_string(std::string_view name)
    {
        const std::string lname = to_lower(strip(name));
        for (auto repo : { TargetRepository::kCORE,
                           TargetRepository::kEXTRA,
                           TargetRepository::kCOMMUNITY,
                           TargetRepository::kMULTILIB })
        {
            if (to_string(repo) == lname)
                return repo;
        }
        return std::nullopt;
    }

    std::string database_path(TargetRepository repo)
    {
        const std::string name = to_string(repo);
        return fmt::format("{0}/os/x86_64/{0}.db", name);
    }
}

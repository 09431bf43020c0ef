#include <cerrno>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <optional>
#include <type_traits>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorup/mirrorlist.hpp>

namespace mirrorup
{
    std::string to_pacman_mirror_list(const MirrorRecord& mirror)
    {
        return fmt::format("Server = {}$repo/os/$arch", mirror.url);
    }

    std::string to_pacman_mirror_list(const Mirrors& mirrors)
    {
        std::string list;
        for (const auto& m : mirrors)
        {
            list += to_pacman_mirror_list(m);
            list += '\n';
        }
        return list;
    }

    std::string mirrorlist_header(const std::string& source_url)
    {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);

        return fmt::format(
            "#\n"
            "# /etc/pacman.d/mirrorlist\n"
            "#\n"
            "#\n"
            "# Arch Linux mirrorlist generated by mirrorup\n"
            "#\n"
            "# source: {}\n"
            "# when: {:%a, %d %b %Y %H:%M:%S %z}\n"
            "#\n"
            "\n",
            source_url,
            local);
    }

    namespace
    {
        tl::expected<void, MirrorupError> write_file(const fs::path& path,
                                                     const std::string& content)
        {
            std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!out)
            {
                return tl::unexpected(MirrorupError::fatal(
                    ErrorCode::MU_IO, fmt::format("Could not open `{}` for writing", path.string())));
            }
            out << content;
            out.flush();
            if (!out)
            {
                return tl::unexpected(MirrorupError::fatal(
                    ErrorCode::MU_IO, fmt::format("Could not write to `{}`", path.string())));
            }
            return {};
        }

        std::string csv_field(const std::string& value)
        {
            if (value.find_first_of(",\"\r\n") == std::string::npos)
                return value;

            std::string res = "\"";
            for (char c : value)
            {
                if (c == '"')
                    res += '"';
                res += c;
            }
            res += '"';
            return res;
        }

        template <class T>
        std::string csv_field(const std::optional<T>& value)
        {
            if (!value)
                return {};
            if constexpr (std::is_same_v<T, std::string>)
                return csv_field(value.value());
            else
                return fmt::format("{}", value.value());
        }

        std::string csv_field(bool value)
        {
            return value ? "true" : "false";
        }
    }

    std::string to_csv(const Mirrors& mirrors)
    {
        std::string res
            = "url,protocol,last_sync,completion_pct,delay,duration_avg,duration_stddev,score,"
              "active,country,country_code,isos,ipv4,ipv6,details,transfer_rate,weighted_score\n";
        for (const auto& m : mirrors)
        {
            res += fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
                               csv_field(m.url),
                               csv_field(m.protocol),
                               csv_field(m.last_sync),
                               csv_field(m.completion_pct),
                               csv_field(m.delay),
                               csv_field(m.duration_avg),
                               csv_field(m.duration_stddev),
                               csv_field(m.score),
                               csv_field(m.active),
                               csv_field(m.country),
                               csv_field(m.country_code),
                               csv_field(m.isos),
                               csv_field(m.ipv4),
                               csv_field(m.ipv6),
                               csv_field(m.details),
                               csv_field(m.transfer_rate),
                               csv_field(m.weighted_score));
        }
        return res;
    }

    tl::expected<void, MirrorupError> write_mirrorlist_file(const fs::path& path,
                                                            const Mirrors& mirrors,
                                                            const std::string& source_url)
    {
        return write_file(path, mirrorlist_header(source_url) + to_pacman_mirror_list(mirrors));
    }

    tl::expected<void, MirrorupError> write_mirrorlist(std::FILE* out, const Mirrors& mirrors)
    {
        const std::string list = to_pacman_mirror_list(mirrors);
        errno = 0;
        if (std::fwrite(list.data(), 1, list.size(), out) != list.size()
            || std::fflush(out) != 0)
        {
            // e.g. `mirrorup | head -n 3`
            if (errno == EPIPE)
            {
                spdlog::debug("Output closed before the mirror list was written");
                return {};
            }
            return tl::unexpected(
                MirrorupError::fatal(ErrorCode::MU_IO, "Could not write mirror list"));
        }
        return {};
    }

    tl::expected<void, MirrorupError> write_csv(const fs::path& path, const Mirrors& mirrors)
    {
        return write_file(path, to_csv(mirrors));
    }
}

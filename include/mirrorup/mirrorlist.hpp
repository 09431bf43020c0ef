#ifndef MIRRORUP_MIRRORLIST_HPP
#define MIRRORUP_MIRRORLIST_HPP

#include <cstdio>
#include <filesystem>
#include <string>

#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/errors.hpp>
#include <mirrorup/mirror.hpp>

namespace mirrorup
{
    namespace fs = std::filesystem;

    // "Server = <url>$repo/os/$arch"
    MIRRORUP_API std::string to_pacman_mirror_list(const MirrorRecord& mirror);
    // One server line per mirror, each terminated by a newline.
    MIRRORUP_API std::string to_pacman_mirror_list(const Mirrors& mirrors);

    MIRRORUP_API std::string mirrorlist_header(const std::string& source_url);

    MIRRORUP_API tl::expected<void, MirrorupError> write_mirrorlist_file(
        const fs::path& path, const Mirrors& mirrors, const std::string& source_url);

    /** Writes the server lines (no header) to `out` and flushes it.
     * A reader that went away (EPIPE) is not an error, SIGPIPE must be ignored
     * for it to be reported that way.
     */
    MIRRORUP_API tl::expected<void, MirrorupError> write_mirrorlist(std::FILE* out,
                                                                    const Mirrors& mirrors);

    // Every field of every mirror, with a header row.
    MIRRORUP_API std::string to_csv(const Mirrors& mirrors);

    MIRRORUP_API tl::expected<void, MirrorupError> write_csv(const fs::path& path,
                                                             const Mirrors& mirrors);
}

#endif

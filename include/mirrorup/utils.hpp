#ifndef MIRRORUP_UTILS_HPP
#define MIRRORUP_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mirrorup/export.hpp>

namespace mirrorup
{
    MIRRORUP_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    MIRRORUP_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    MIRRORUP_API std::string string_transform(const std::string_view& input, int (*functor)(int));
    MIRRORUP_API std::string to_lower(const std::string_view& input);
    MIRRORUP_API bool contains(const std::string_view& str, const std::string_view& sub_str);

    // Removes leading and trailing whitespace.
    MIRRORUP_API std::string_view strip(const std::string_view& input);

    MIRRORUP_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    // Joins a base url and a relative path with exactly one '/' between them.
    MIRRORUP_API std::string join_url(const std::string_view& base, const std::string_view& path);

    // Lowercase host part of `url`, or an empty string if the url cannot be parsed.
    MIRRORUP_API std::string url_host(const std::string& url);
}

#endif

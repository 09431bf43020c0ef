#include <memory>

extern "C"
{
#include <curl/curl.h>
}

#include <mirrorup/utils.hpp>

namespace mirrorup
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::string_view strip(const std::string_view& input)
    {
        std::size_t start = 0;
        std::size_t end = input.size();
        while (start < end && std::isspace(static_cast<unsigned char>(input[start])))
        {
            ++start;
        }
        while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])))
        {
            --end;
        }
        return input.substr(start, end - start);
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    std::string join_url(const std::string_view& base, const std::string_view& path)
    {
        if (base.empty())
            return std::string(path);
        if (path.empty())
            return std::string(base);

        std::string res(base);
        if (ends_with(base, "/") && starts_with(path, "/"))
        {
            res.append(path.substr(1));
        }
        else if (ends_with(base, "/") || starts_with(path, "/"))
        {
            res.append(path);
        }
        else
        {
            res.push_back('/');
            res.append(path);
        }
        return res;
    }

    std::string url_host(const std::string& url)
    {
        std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), &curl_url_cleanup);
        if (!handle)
            return {};

        if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
            return {};

        char* host = nullptr;
        if (curl_url_get(handle.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK)
            return {};

        std::string res = to_lower(host);
        curl_free(host);
        return res;
    }
}

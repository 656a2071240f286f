/*
 * File: include/common/uri_path.hpp
 * Project: Tally Language Server
 * Purpose: Editor document URI -> local file path
 * Notes:
 *  - file:///var/log/test.txt    -> /var/log/test.txt
 *  - file:///C:/path/to/file.txt -> C:\path\to\file.txt (Windows builds)
 *  - Anything that is not a local file URI is stripped lexically and never rejected
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

inline int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Malformed escapes are copied through untouched.
inline std::string percent_decode(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '%' && i + 2 < s.size())
        {
            int hi = hex_digit(s[i + 1]);
            int lo = hex_digit(s[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// Everything after "scheme://" (or "scheme:" when there is no authority).
inline std::string strip_uri_scheme(const std::string &uri)
{
    auto p = uri.find("://");
    if (p != std::string::npos)
        return uri.substr(p + 3);
    auto colon = uri.find(':');
    if (colon == std::string::npos || colon < 2)
        return uri;
    return uri.substr(colon + 1);
}

inline std::optional<std::string> file_uri_to_path(const std::string &uri)
{
    const std::string prefix = "file://";
    if (uri.size() < prefix.size())
        return std::nullopt;
    std::string scheme = uri.substr(0, prefix.size());
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (scheme != prefix)
        return std::nullopt;

    std::string rest = uri.substr(prefix.size());
    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos)
        rest.resize(cut);

    auto slash = rest.find('/');
    if (slash == std::string::npos)
        return std::nullopt;
    const std::string host = rest.substr(0, slash);
    if (!host.empty() && host != "localhost")
        return std::nullopt;

    std::string path = percent_decode(rest.substr(slash));
    if (path.find('\0') != std::string::npos)
        return std::nullopt;

#ifdef _WIN32
    // "/C:/x" -> "C:\x"
    if (path.size() >= 3 && path[0] == '/' && std::isalpha(static_cast<unsigned char>(path[1])) && path[2] == ':')
        path.erase(0, 1);
    else
        return std::nullopt;
    std::replace(path.begin(), path.end(), '/', '\\');
#endif
    return path;
}

inline std::string uri_to_path(const std::string &uri)
{
    if (auto p = file_uri_to_path(uri))
        return *p;
    return strip_uri_scheme(uri);
}

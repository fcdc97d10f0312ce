#pragma once

#include <string>
#include <string_view>

namespace imgbuild {

// Clean an archive entry name without changing its meaning:
// - collapse duplicate slashes
// - strip leading "./" segments (a leading "/" is kept so callers can reject it)
// - strip a trailing "/" (directory entries)
inline std::string NormalizeEntryName(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    const bool absolute = !out.empty() && out.front() == '/';
    std::string body = absolute ? out.substr(1) : out;
    while (body.rfind("./", 0) == 0) body.erase(0, 2);
    while (body.size() > 1 && body.back() == '/') body.pop_back();
    return absolute ? "/" + body : body;
}

inline std::string PathBase(std::string_view p) {
    while (p.size() > 1 && p.back() == '/') p.remove_suffix(1);
    const auto pos = p.rfind('/');
    if (pos == std::string_view::npos) return std::string(p);
    if (p.size() == 1) return "/";
    return std::string(p.substr(pos + 1));
}

inline std::string PathDir(std::string_view p) {
    while (p.size() > 1 && p.back() == '/') p.remove_suffix(1);
    const auto pos = p.rfind('/');
    if (pos == std::string_view::npos) return ".";
    if (pos == 0) return "/";
    return std::string(p.substr(0, pos));
}

} // namespace imgbuild

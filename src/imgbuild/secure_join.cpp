#include "imgbuild/secure_join.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <deque>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace imgbuild {

namespace {

constexpr int kMaxSymlinkHops = 255;

std::deque<std::string> SplitPath(std::string_view p) {
    std::deque<std::string> parts;
    while (!p.empty()) {
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (!seg.empty() && seg != ".") parts.emplace_back(seg);
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos + 1);
    }
    return parts;
}

std::string JoinUnder(const std::string& root, const std::vector<std::string>& parts) {
    std::string out = root;
    for (const auto& part : parts) {
        if (out.empty() || out.back() != '/') out.push_back('/');
        out += part;
    }
    return out;
}

Result ReadLink(const std::string& path, std::string& out) {
    std::vector<char> buf(256);
    while (true) {
        const ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size());
        if (n < 0) {
            return Result::Errno("readlink " + path);
        }
        if (static_cast<size_t>(n) < buf.size()) {
            out.assign(buf.data(), static_cast<size_t>(n));
            return Result::Ok();
        }
        buf.resize(buf.size() * 2);
    }
}

} // namespace

Result SecureJoin(const std::string& root, std::string_view unsafe, std::string& out, JoinPolicy policy) {
    std::string base = root.empty() ? std::string(".") : root;
    while (base.size() > 1 && base.back() == '/') base.pop_back();

    const bool clamp = policy == JoinPolicy::Clamp;
    const std::string name = NormalizeEntryName(unsafe);
    if (!clamp && !name.empty() && name.front() == '/') {
        return Result::Fail(-1, "absolute path not allowed: " + std::string(unsafe));
    }

    std::deque<std::string> pending = SplitPath(name);
    std::vector<std::string> resolved;
    int hops = 0;

    while (!pending.empty()) {
        std::string seg = std::move(pending.front());
        pending.pop_front();

        if (seg == "..") {
            if (resolved.empty()) {
                if (clamp) continue;
                return Result::Fail(-1, "path escapes destination: " + std::string(unsafe));
            }
            resolved.pop_back();
            continue;
        }

        resolved.push_back(seg);
        const std::string candidate = JoinUnder(base, resolved);

        struct stat st{};
        if (::lstat(candidate.c_str(), &st) != 0) {
            const int err = errno;
            if (err == ENOENT || err == ENOTDIR) continue;
            return Result::Errno(err, "lstat " + candidate);
        }
        if (!S_ISLNK(st.st_mode)) continue;

        if (++hops > kMaxSymlinkHops) {
            return Result::Fail(ELOOP, "too many symlinks resolving " + std::string(unsafe));
        }

        std::string target;
        auto rl = ReadLink(candidate, target);
        if (!rl.is_ok()) return rl;

        resolved.pop_back();
        if (!target.empty() && target.front() == '/') {
            resolved.clear();
        }
        auto link_parts = SplitPath(target);
        pending.insert(pending.begin(), link_parts.begin(), link_parts.end());
    }

    out = JoinUnder(base, resolved);
    return Result::Ok();
}

} // namespace imgbuild

#include "system/prerequisites.hpp"

#include "util/logger.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>

#include <sys/stat.h>
#include <unistd.h>

namespace imgbuild {

namespace {

bool IsExecutableFile(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

Result ResolveExecutable(const std::string& name, std::string& out) {
    if (name.empty()) return Result::Fail(EINVAL, "empty executable name");

    if (name.find('/') != std::string::npos) {
        if (!IsExecutableFile(name)) {
            return Result::Fail(ENOENT, name + " is not an executable file");
        }
        out = name;
        return Result::Ok();
    }

    const char* env = std::getenv("PATH");
    std::string_view path = (env && *env) ? env : "/usr/local/bin:/usr/bin:/bin";
    while (true) {
        const auto colon = path.find(':');
        std::string dir(path.substr(0, colon));
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + name;
        if (IsExecutableFile(candidate)) {
            out = candidate;
            return Result::Ok();
        }
        if (colon == std::string_view::npos) break;
        path.remove_prefix(colon + 1);
    }
    return Result::Fail(ENOENT, name + " not found in $PATH");
}

Result CheckRuntimePrerequisites(const config::BuilderConfig& cfg) {
    std::string resolved;
    if (auto r = ResolveExecutable(cfg.solver, resolved); !r.is_ok()) {
        return r.Wrap("solver");
    }
    LogDebug("solver: %s", resolved.c_str());

    if (auto r = ResolveExecutable(cfg.runtime_helper, resolved); !r.is_ok()) {
        return r.Wrap("runtime helper");
    }
    LogDebug("runtime helper: %s", resolved.c_str());

    std::error_code ec;
    std::filesystem::create_directories(cfg.state_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "state directory " + cfg.state_dir + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(cfg.state_dir, ec)) {
        return Result::Fail(ENOTDIR, "state directory " + cfg.state_dir + " is not a directory");
    }
    return Result::Ok();
}

} // namespace imgbuild

#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cerrno>
#include <cstdlib>

#include <sys/stat.h>

namespace imgbuild::config {

void BuilderConfig::Reset() {
    *this = BuilderConfig{};
}

Result BuilderConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(EINVAL, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(EINVAL, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

Result BuilderConfig::Load(const std::string& cli_path) {
    std::string path = cli_path;
    if (path.empty()) {
        const char* env = std::getenv(kConfigEnv);
        if (env && *env) path = env;
    }

    if (path.empty()) {
        struct stat st {};
        if (::stat(kDefaultConfigPath, &st) != 0 && errno == ENOENT) {
            Reset();
            LogDebug("config: %s not found, using defaults", kDefaultConfigPath);
            return Result::Ok();
        }
        path = kDefaultConfigPath;
    }

    LogDebug("config: loading %s", path.c_str());
    return LoadFile(path);
}

} // namespace imgbuild::config

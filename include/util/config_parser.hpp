#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace imgbuild::config {

inline constexpr char kDefaultConfigPath[] = "/etc/imgbuild/imgbuild.conf";
inline constexpr char kConfigEnv[] = "IMGBUILD_CONFIG";

class BuilderConfig {
public:
    std::string solver = "buildkit-solver";
    std::vector<std::string> solver_args;
    std::string state_dir = "/var/lib/imgbuild";
    std::string backend = "auto";
    std::string runtime_helper = "runc";
    std::string temp_dir;  // empty => $TMPDIR or /tmp

    std::optional<LogLevel> log_level;

    // Parses one file over the built-in defaults.
    Result LoadFile(const std::string& path);

    // Picks the file to read: `cli_path` if set, else $IMGBUILD_CONFIG, else
    // the default path. Only the default path may be missing.
    Result Load(const std::string& cli_path);

    void Reset();
};

} // namespace imgbuild::config

#pragma once

#include <map>
#include <string>
#include <vector>

namespace imgbuild {

// Raw user input for one build, as collected from the command line.
struct BuildOptions {
    std::string recipe_path;   // empty => <context>/Dockerfile
    std::string context_dir;
    std::vector<std::string> tags;
    std::string target;
    std::vector<std::string> platforms;
    std::vector<std::string> build_args;  // "KEY=VALUE"
    std::vector<std::string> labels;      // "KEY=VALUE"
    bool no_cache = false;
};

// Validated, normalized build. Immutable once a solve starts.
struct BuildRequest {
    std::string recipe_path;
    std::string context_dir;
    std::vector<std::string> tags;  // fully normalized; tags[0] is the primary
    std::string target;             // empty => absent
    std::vector<std::string> platforms;
    std::map<std::string, std::string> build_args;
    std::map<std::string, std::string> labels;
    bool no_cache = false;

    const std::string& PrimaryTag() const { return tags.front(); }
};

using FrontendAttributes = std::map<std::string, std::string>;

// Names of the local directories the solve engine reads from.
inline constexpr char kLocalDirContext[] = "context";
inline constexpr char kLocalDirRecipe[] = "dockerfile-dir";

using LocalDirs = std::map<std::string, std::string>;

struct ExportDescriptor {
    std::string type = "image";
    std::map<std::string, std::string> attrs;
};

// Everything a solve needs, derived from one BuildRequest.
struct SolvePlan {
    BuildRequest request;
    FrontendAttributes frontend_attrs;
    ExportDescriptor exporter;
    LocalDirs local_dirs;
};

} // namespace imgbuild

#include "util/config_json_utils.hpp"

#include <fstream>

namespace imgbuild::config::detail {

namespace {

// Returns false when the key is absent. A present key of the wrong type is
// an error.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return false;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j,
                             const char* key,
                             std::vector<std::string>& out,
                             std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return false;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, BuilderConfig& cfg, std::string& err) {
    GetStringIfPresent(j, "Solver", cfg.solver, err);
    GetStringArrayIfPresent(j, "SolverArgs", cfg.solver_args, err);
    GetStringIfPresent(j, "StateDir", cfg.state_dir, err);
    GetStringIfPresent(j, "Backend", cfg.backend, err);
    GetStringIfPresent(j, "RuntimeHelper", cfg.runtime_helper, err);
    GetStringIfPresent(j, "TempDir", cfg.temp_dir, err);
    if (!err.empty())
        return false;

    std::string level;
    if (GetStringIfPresent(j, "LogLevel", level, err)) {
        cfg.log_level = ParseLogLevel(level);
        if (!cfg.log_level) {
            err = "unknown LogLevel \"" + level + "\"";
            return false;
        }
    }
    if (!err.empty())
        return false;

    if (cfg.solver.empty()) {
        err = "Solver must not be empty";
        return false;
    }
    if (cfg.state_dir.empty()) {
        err = "StateDir must not be empty";
        return false;
    }

    return true;
}

} // namespace imgbuild::config::detail

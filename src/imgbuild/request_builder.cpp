#include "imgbuild/request_builder.hpp"

#include "imgbuild/context_materializer.hpp"
#include "imgbuild/reference.hpp"
#include "imgbuild/secure_join.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/platform.hpp"

namespace imgbuild {

namespace {

std::string Join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

Result ParseKeyValues(const std::vector<std::string>& entries,
                      const char* what,
                      std::map<std::string, std::string>& out) {
    for (const auto& entry : entries) {
        auto kv = RequestBuilder::ParseKeyValue(entry, what);
        if (!kv) return Result::Fail(-1, kv.error());
        out[kv->first] = kv->second;
    }
    return Result::Ok();
}

} // namespace

RequestBuilder::RequestBuilder() : host_platform_(DefaultPlatform()) {}

RequestBuilder::RequestBuilder(std::string host_platform)
    : host_platform_(std::move(host_platform)) {}

std::expected<std::pair<std::string, std::string>, std::string>
RequestBuilder::ParseKeyValue(std::string_view entry, std::string_view what) {
    const auto eq = entry.find('=');
    if (eq == std::string_view::npos) {
        return std::unexpected("invalid " + std::string(what) + " value " + std::string(entry));
    }
    return std::make_pair(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
}

Result RequestBuilder::Build(const BuildOptions& opt, SolvePlan& out) const {
    out = SolvePlan{};
    BuildRequest& req = out.request;

    if (opt.tags.empty()) {
        return Result::Fail(-1, "please specify an image tag with `-t`");
    }
    if (opt.context_dir.empty()) {
        return Result::Fail(-1, "please specify build context (e.g. \".\" for the current directory)");
    }
    req.context_dir = opt.context_dir;

    req.tags.reserve(opt.tags.size());
    for (const auto& tag : opt.tags) {
        auto normalized = NormalizeImageTag(tag);
        if (!normalized) {
            return Result::Fail(-1, "parsing image name \"" + tag + "\" failed: " + normalized.error());
        }
        req.tags.push_back(std::move(*normalized));
    }

    if (opt.recipe_path.empty()) {
        auto jr = SecureJoin(req.context_dir, kDefaultRecipeName, req.recipe_path);
        if (!jr.is_ok()) return jr.Wrap("resolving default recipe path");
    } else {
        req.recipe_path = opt.recipe_path;
    }

    req.platforms = opt.platforms.empty() ? std::vector<std::string>{host_platform_} : opt.platforms;
    req.target = opt.target;
    req.no_cache = opt.no_cache;

    auto br = ParseKeyValues(opt.build_args, "build-arg", req.build_args);
    if (!br.is_ok()) return br;
    auto lr = ParseKeyValues(opt.labels, "label", req.labels);
    if (!lr.is_ok()) return lr;

    // The engine reads the recipe from the "dockerfile-dir" local directory,
    // so only the base name goes into the attributes.
    FrontendAttributes& attrs = out.frontend_attrs;
    attrs["filename"] = PathBase(req.recipe_path);
    if (!req.target.empty()) attrs["target"] = req.target;
    attrs["platform"] = Join(req.platforms, ",");
    if (req.no_cache) attrs["no-cache"] = "";
    for (const auto& [k, v] : req.build_args) attrs["build-arg:" + k] = v;
    for (const auto& [k, v] : req.labels) attrs["label:" + k] = v;

    out.exporter.type = "image";
    out.exporter.attrs["name"] = Join(req.tags, ",");

    out.local_dirs[kLocalDirContext] = req.context_dir;
    out.local_dirs[kLocalDirRecipe] = PathDir(req.recipe_path);

    LogDebug("request: recipe=%s context=%s platform=%s tags=%s",
             req.recipe_path.c_str(),
             req.context_dir.c_str(),
             attrs["platform"].c_str(),
             out.exporter.attrs["name"].c_str());
    return Result::Ok();
}

} // namespace imgbuild

#include "imgbuild/build_command.hpp"

#include "imgbuild/context_materializer.hpp"
#include "imgbuild/request_builder.hpp"
#include "imgbuild/secure_join.hpp"
#include "system/prerequisites.hpp"
#include "util/logger.hpp"
#include "util/temp_path.hpp"

#include <sys/stat.h>

namespace imgbuild {

namespace {

bool Exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

// A recipe named alongside an archive context is the user's path as given.
// A relative name that is missing on the host but present in the extracted
// context is taken from the context instead.
std::string ResolveRecipeForArchive(const std::string& recipe, const std::string& context_dir) {
    if (recipe.front() == '/' || Exists(recipe)) return recipe;

    std::string in_context;
    if (SecureJoin(context_dir, recipe, in_context).is_ok() && Exists(in_context)) {
        LogDebug("recipe %s found inside the streamed context", recipe.c_str());
        return in_context;
    }
    return recipe;
}

} // namespace

BuildCommand::BuildCommand(const config::BuilderConfig& cfg,
                           ISolveEngine& engine,
                           IStatusDisplay& display,
                           IReader& stdin_reader,
                           std::FILE* out)
    : cfg_(cfg), engine_(engine), display_(display), stdin_(stdin_reader), out_(out ? out : stdout) {}

Result BuildCommand::Run(std::stop_token st, const BuildOptions& opt) {
    last_state_ = SolveState::Idle;

    if (opt.context_dir.empty()) {
        return Result::Fail(EINVAL, "please specify build context (e.g. \".\" for the current directory)");
    }
    if (opt.tags.empty()) {
        return Result::Fail(EINVAL, "please specify an image tag with `-t`");
    }
    const bool recipe_from_stdin = opt.recipe_path == kStdinPath;
    const bool context_from_stdin = opt.context_dir == kStdinPath;
    if (recipe_from_stdin && context_from_stdin) {
        return Result::Fail(EINVAL, "cannot read both the recipe and the build context from stdin");
    }

    if (auto r = CheckRuntimePrerequisites(cfg_); !r.is_ok()) {
        return r.Wrap("checking runtime prerequisites");
    }

    // Declared before the request so they outlive the solve.
    TempFile recipe_tmp;
    TempDirectory context_tmp;
    ContextMaterializer materializer(cfg_.temp_dir);

    BuildOptions eff = opt;
    if (recipe_from_stdin) {
        if (auto r = materializer.RecipeFromStream(stdin_, recipe_tmp); !r.is_ok()) {
            return r.Wrap("reading recipe from stdin failed");
        }
        eff.recipe_path = recipe_tmp.Path();
    }

    if (context_from_stdin) {
        std::string written_recipe;
        if (auto r = materializer.ContextFromStream(opt.recipe_path, stdin_, context_tmp, &written_recipe);
            !r.is_ok()) {
            return r.Wrap("reading context from stdin failed");
        }
        eff.context_dir = context_tmp.Path();
        if (!written_recipe.empty()) {
            eff.recipe_path = written_recipe;
        } else if (!opt.recipe_path.empty()) {
            eff.recipe_path = ResolveRecipeForArchive(opt.recipe_path, eff.context_dir);
        }
    }

    RequestBuilder builder;
    SolvePlan plan;
    if (auto r = builder.Build(eff, plan); !r.is_ok()) return r;

    std::fprintf(out_, "Building %s\n", plan.request.PrimaryTag().c_str());
    std::fflush(out_);

    SolveOrchestrator orchestrator(engine_, display_);
    Result res = orchestrator.Run(st, plan);
    last_state_ = orchestrator.State();
    if (!res.is_ok()) {
        LogDebug("build %s: %s", SolveStateName(last_state_), res.msg.c_str());
        return res;
    }

    std::fprintf(out_, "Successfully built %s\n", plan.request.PrimaryTag().c_str());
    std::fflush(out_);
    return Result::Ok();
}

} // namespace imgbuild

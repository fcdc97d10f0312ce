#include "imgbuild/solve_orchestrator.hpp"

#include "imgbuild/progress_relay.hpp"
#include "util/identity.hpp"
#include "util/logger.hpp"
#include "util/task_group.hpp"

#include <cstring>
#include <memory>

#include <sys/stat.h>

namespace imgbuild {

namespace {

// Room for a few batches so the solver is not stalled on every render.
constexpr std::size_t kStatusBuffer = 32;

Result CheckExists(const std::string& path, const char* what) {
    struct stat st {};
    if (path.empty()) return Result::Fail(EINVAL, std::string(what) + " path is empty");
    if (::stat(path.c_str(), &st) != 0) {
        return Result::Errno(std::string(what) + " " + path);
    }
    return Result::Ok();
}

} // namespace

const char* SolveStateName(SolveState s) {
    switch (s) {
    case SolveState::Idle:
        return "idle";
    case SolveState::SessionStarting:
        return "session-starting";
    case SolveState::Solving:
        return "solving";
    case SolveState::Succeeded:
        return "succeeded";
    case SolveState::Failed:
        return "failed";
    case SolveState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

SolveOrchestrator::SolveOrchestrator(ISolveEngine& engine, IStatusDisplay& display)
    : engine_(engine), display_(display) {}

void SolveOrchestrator::SetState(SolveState s) {
    state_.store(s);
    LogDebug("solve state: %s", SolveStateName(s));
    if (observer_) observer_(s);
}

Result SolveOrchestrator::Finish(std::stop_token ctx, Result r) {
    if (r.is_ok()) {
        SetState(SolveState::Succeeded);
    } else if (r.is_cancelled() && ctx.stop_requested()) {
        SetState(SolveState::Cancelled);
    } else {
        SetState(SolveState::Failed);
    }
    return r;
}

Result SolveOrchestrator::Run(std::stop_token ctx, const SolvePlan& plan) {
    if (ctx.stop_requested()) return Finish(ctx, Result::Cancelled("build cancelled"));

    if (Result r = CheckExists(plan.request.recipe_path, "recipe"); !r.is_ok()) return Finish(ctx, r);
    if (Result r = CheckExists(plan.request.context_dir, "build context"); !r.is_ok()) return Finish(ctx, r);

    SetState(SolveState::SessionStarting);

    std::unique_ptr<ISessionTransport> session;
    if (Result r = engine_.OpenSession(plan.local_dirs, session); !r.is_ok()) {
        return Finish(ctx, r.Wrap("starting session"));
    }

    SolveRequest req;
    if (Result r = NewId(req.ref); !r.is_ok()) return Finish(ctx, r.Wrap("creating solve id"));
    req.session_id = session->Id();
    req.frontend_attrs = plan.frontend_attrs;
    req.exporter = plan.exporter.type;
    req.exporter_attrs = plan.exporter.attrs;

    LogInfo("solve %s: session %s", req.ref.c_str(), req.session_id.c_str());

    StatusChannel status(kStatusBuffer);
    Result res;
    {
        TaskGroup group(ctx);

        group.Go([&session](std::stop_token st) -> Result {
            Result r = session->Run(st);
            return r.is_ok() ? r : r.Wrap("session");
        });

        group.Go([&](std::stop_token st) -> Result {
            Result r = engine_.Solve(req, status, st);
            session->Close();
            status.Close();
            return r.is_ok() ? r : r.Wrap("solve");
        });

        SetState(SolveState::Solving);

        group.Go([&](std::stop_token st) -> Result {
            return ProgressRelay::Run(status, display_, st);
        });

        res = group.Wait();
    }

    return Finish(ctx, res);
}

} // namespace imgbuild

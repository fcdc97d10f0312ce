#pragma once

#include "imgbuild/build_request.hpp"
#include "imgbuild/solve_engine.hpp"
#include "imgbuild/status_display.hpp"
#include "util/result.hpp"

#include <atomic>
#include <functional>
#include <stop_token>

namespace imgbuild {

enum class SolveState {
    Idle,
    SessionStarting,
    Solving,
    Succeeded,
    Failed,
    Cancelled,
};

const char* SolveStateName(SolveState s);

// Runs one solve as three concurrent tasks sharing a stop source:
// the session transport, the solve request feeding a status channel, and the
// progress relay draining it into the display. The first task to fail stops
// the others and its error is returned.
class SolveOrchestrator {
  public:
    using StateObserver = std::function<void(SolveState)>;

    SolveOrchestrator(ISolveEngine& engine, IStatusDisplay& display);

    // Blocks until all three tasks have finished. Stopping `ctx` cancels the
    // solve. One orchestrator runs one solve.
    Result Run(std::stop_token ctx, const SolvePlan& plan);

    SolveState State() const { return state_.load(); }
    void SetStateObserver(StateObserver obs) { observer_ = std::move(obs); }

  private:
    void SetState(SolveState s);
    Result Finish(std::stop_token ctx, Result r);

    ISolveEngine& engine_;
    IStatusDisplay& display_;
    std::atomic<SolveState> state_{SolveState::Idle};
    StateObserver observer_;
};

} // namespace imgbuild

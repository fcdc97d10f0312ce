#pragma once

#include "imgbuild/build_request.hpp"
#include "imgbuild/solve_engine.hpp"
#include "imgbuild/solve_orchestrator.hpp"
#include "imgbuild/status_display.hpp"
#include "io/io.hpp"
#include "util/config_parser.hpp"
#include "util/result.hpp"

#include <cstdio>
#include <stop_token>

namespace imgbuild {

// `imgbuild build`: stdin materialization, request building and the solve,
// with every temporary resource removed before Run() returns.
class BuildCommand {
  public:
    BuildCommand(const config::BuilderConfig& cfg,
                 ISolveEngine& engine,
                 IStatusDisplay& display,
                 IReader& stdin_reader,
                 std::FILE* out = stdout);

    Result Run(std::stop_token st, const BuildOptions& opt);

    // State reached by the last solve; Idle if none was started.
    SolveState LastState() const { return last_state_; }

  private:
    const config::BuilderConfig& cfg_;
    ISolveEngine& engine_;
    IStatusDisplay& display_;
    IReader& stdin_;
    std::FILE* out_;
    SolveState last_state_ = SolveState::Idle;
};

} // namespace imgbuild

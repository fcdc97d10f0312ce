#pragma once

#include "imgbuild/status.hpp"
#include "imgbuild/status_display.hpp"
#include "util/channel.hpp"
#include "util/result.hpp"

#include <stop_token>

namespace imgbuild {

using StatusChannel = Channel<engine::StatusResponse>;
using DisplayChannel = Channel<SolveStatus>;

// Pure per-batch mapping from the engine's shape to the display shape.
SolveStatus TranslateStatus(const engine::StatusResponse& resp);

class ProgressRelay {
  public:
    // Translates every batch from `in` into `out`, in order, until `in` is
    // closed and drained; then closes `out`. Not restartable.
    static Result Pump(StatusChannel& in, DisplayChannel& out, std::stop_token st);

    // Pump on a helper thread feeding `display` on the calling thread.
    // Returns once the engine stream has ended and the display finished.
    static Result Run(StatusChannel& in, IStatusDisplay& display, std::stop_token st);
};

} // namespace imgbuild

#include "imgbuild/progress_relay.hpp"

#include "util/logger.hpp"

#include <thread>

namespace imgbuild {

namespace {

constexpr std::size_t kDisplayBuffer = 16;

TimePoint FromUnixNanos(std::int64_t ns) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::nanoseconds(ns)));
}

std::optional<TimePoint> FromUnixNanos(const std::optional<std::int64_t>& ns) {
    if (!ns) return std::nullopt;
    return FromUnixNanos(*ns);
}

} // namespace

SolveStatus TranslateStatus(const engine::StatusResponse& resp) {
    SolveStatus s;
    s.vertexes.reserve(resp.vertexes.size());
    for (const auto& v : resp.vertexes) {
        s.vertexes.push_back(Vertex{
            .digest = v.digest,
            .inputs = v.inputs,
            .name = v.name,
            .started = FromUnixNanos(v.started_ns),
            .completed = FromUnixNanos(v.completed_ns),
            .cached = v.cached,
            .error = v.error,
        });
    }
    s.statuses.reserve(resp.statuses.size());
    for (const auto& v : resp.statuses) {
        s.statuses.push_back(VertexStatus{
            .id = v.id,
            .vertex = v.vertex,
            .name = v.name,
            .total = v.total,
            .current = v.current,
            .timestamp = FromUnixNanos(v.timestamp_ns),
            .started = FromUnixNanos(v.started_ns),
            .completed = FromUnixNanos(v.completed_ns),
        });
    }
    s.logs.reserve(resp.logs.size());
    for (const auto& v : resp.logs) {
        s.logs.push_back(VertexLog{
            .vertex = v.vertex,
            .stream = static_cast<int>(v.stream),
            .data = v.msg,
            .timestamp = FromUnixNanos(v.timestamp_ns),
        });
    }
    return s;
}

Result ProgressRelay::Pump(StatusChannel& in, DisplayChannel& out, std::stop_token st) {
    engine::StatusResponse resp;
    while (in.Receive(resp, st)) {
        if (!out.Send(TranslateStatus(resp), st)) break;
    }
    out.Close();
    if (st.stop_requested()) return Result::Cancelled("progress relay cancelled");
    return Result::Ok();
}

Result ProgressRelay::Run(StatusChannel& in, IStatusDisplay& display, std::stop_token st) {
    DisplayChannel out(kDisplayBuffer);

    // Stops the pump if the display gives up before the stream ends.
    std::stop_source pump_stop;
    std::stop_callback forward(st, [&pump_stop] { pump_stop.request_stop(); });

    Result pump_res;
    std::jthread pump([&] { pump_res = Pump(in, out, pump_stop.get_token()); });

    Result display_res;
    SolveStatus status;
    while (out.Receive(status, st)) {
        display_res = display.OnStatus(status);
        if (!display_res.is_ok()) {
            LogWarn("progress display failed: %s", display_res.msg.c_str());
            pump_stop.request_stop();
            break;
        }
    }
    pump.join();

    if (!display_res.is_ok()) return display_res.Wrap("progress display");
    if (st.stop_requested()) return Result::Cancelled("progress relay cancelled");
    if (!pump_res.is_ok()) return pump_res;
    return display.Finish();
}

} // namespace imgbuild

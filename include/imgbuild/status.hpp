#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace imgbuild {

// Status as the solve engine emits it: Unix-nanosecond timestamps and a
// raw int64 stream selector.
namespace engine {

struct VertexRecord {
    std::string digest;
    std::vector<std::string> inputs;
    std::string name;
    std::optional<std::int64_t> started_ns;
    std::optional<std::int64_t> completed_ns;
    bool cached = false;
    std::string error;
};

struct VertexStatusRecord {
    std::string id;
    std::string vertex;
    std::string name;
    std::int64_t current = 0;
    std::int64_t total = 0;
    std::int64_t timestamp_ns = 0;
    std::optional<std::int64_t> started_ns;
    std::optional<std::int64_t> completed_ns;
};

struct VertexLogRecord {
    std::string vertex;
    std::int64_t stream = 0;
    std::vector<std::uint8_t> msg;
    std::int64_t timestamp_ns = 0;
};

struct StatusResponse {
    std::vector<VertexRecord> vertexes;
    std::vector<VertexStatusRecord> statuses;
    std::vector<VertexLogRecord> logs;
};

} // namespace engine

// Display-neutral status handed to renderers.
using TimePoint = std::chrono::system_clock::time_point;

struct Vertex {
    std::string digest;
    std::vector<std::string> inputs;
    std::string name;
    std::optional<TimePoint> started;
    std::optional<TimePoint> completed;
    bool cached = false;
    std::string error;
};

struct VertexStatus {
    std::string id;
    std::string vertex;
    std::string name;
    std::int64_t total = 0;
    std::int64_t current = 0;
    TimePoint timestamp{};
    std::optional<TimePoint> started;
    std::optional<TimePoint> completed;
};

struct VertexLog {
    std::string vertex;
    int stream = 0;  // 1 = stdout, 2 = stderr
    std::vector<std::uint8_t> data;
    TimePoint timestamp{};
};

struct SolveStatus {
    std::vector<Vertex> vertexes;
    std::vector<VertexStatus> statuses;
    std::vector<VertexLog> logs;
};

} // namespace imgbuild

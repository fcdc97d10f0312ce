#pragma once

#include "imgbuild/solve_engine.hpp"
#include "imgbuild/status.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace imgbuild {

// Wire format shared with the solver process: one JSON request on its
// stdin, newline-delimited JSON status batches on its stdout.
//
// Status batch:
//   {"vertexes":[{"digest","inputs","name","started","completed","cached","error"}],
//    "statuses":[{"id","vertex","name","current","total","timestamp","started","completed"}],
//    "logs":[{"vertex","stream","data","timestamp"}]}
// Timestamps are Unix nanoseconds (null when absent); log data is base64.

std::expected<engine::StatusResponse, std::string> DecodeStatusLine(std::string_view line);

std::string EncodeSolveRequest(const SolveRequest& req,
                               const std::string& state_dir,
                               const std::string& backend);

std::expected<std::vector<std::uint8_t>, std::string> DecodeBase64(std::string_view in);
std::string EncodeBase64(const std::vector<std::uint8_t>& in);

} // namespace imgbuild

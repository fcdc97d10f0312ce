#pragma once

#include "imgbuild/build_request.hpp"
#include "imgbuild/progress_relay.hpp"
#include "util/result.hpp"

#include <map>
#include <memory>
#include <stop_token>
#include <string>

namespace imgbuild {

inline constexpr char kDockerfileFrontend[] = "dockerfile.v0";

// One solve as submitted to the engine.
struct SolveRequest {
    std::string ref;         // unique per solve
    std::string session_id;  // session that serves the local directories
    std::string frontend = kDockerfileFrontend;
    FrontendAttributes frontend_attrs;
    std::string exporter = "image";
    std::map<std::string, std::string> exporter_attrs;
};

// Side channel through which the engine reads the local directories.
class ISessionTransport {
  public:
    virtual ~ISessionTransport() = default;

    virtual const std::string& Id() const = 0;

    // Serves requests until Close() is called or `st` is stopped.
    virtual Result Run(std::stop_token st) = 0;

    // Idempotent; makes a concurrent Run() return.
    virtual void Close() = 0;
};

class ISolveEngine {
  public:
    virtual ~ISolveEngine() = default;

    // Prepares a session exposing `dirs` under their logical names. The
    // session is not serving until its Run() is called.
    virtual Result OpenSession(const LocalDirs& dirs, std::unique_ptr<ISessionTransport>& out) = 0;

    // Runs the solve to completion, pushing every status batch into
    // `status` in order. Does not close `status`. Returns a cancelled
    // Result when `st` is stopped before the solve finishes.
    virtual Result Solve(const SolveRequest& req, StatusChannel& status, std::stop_token st) = 0;
};

} // namespace imgbuild

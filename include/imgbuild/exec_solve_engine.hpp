#pragma once

#include "imgbuild/solve_engine.hpp"
#include "io/fd.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace imgbuild {

// Session served over a connected unix socket. The engine side sends
// newline-terminated requests:
//   dir <name>   ->  ok <absolute path>  |  error <text>
class SocketSession final : public ISessionTransport {
  public:
    // `on_release` runs when the session is destroyed.
    SocketSession(std::string id,
                  LocalDirs dirs,
                  Fd sock,
                  std::function<void(const std::string&)> on_release = {});
    ~SocketSession() override;

    SocketSession(const SocketSession&) = delete;
    SocketSession& operator=(const SocketSession&) = delete;

    const std::string& Id() const override { return id_; }
    Result Run(std::stop_token st) override;
    void Close() override;

  private:
    std::string Answer(std::string_view request) const;
    Result Reply(const std::string& line);

    std::string id_;
    LocalDirs dirs_;
    Fd sock_;
    std::atomic_bool closed_{false};
    std::function<void(const std::string&)> on_release_;
};

struct ExecSolveEngineOptions {
    std::string solver;                    // executable, looked up in $PATH
    std::vector<std::string> solver_args;
    std::string state_dir;
    std::string backend = "auto";
    std::chrono::milliseconds kill_grace{2000};
};

// Runs the solve in a separate solver process. The request is written to
// its stdin as one JSON document; status batches are read from its stdout
// as newline-delimited JSON. The session socket is inherited as fd 3.
class ExecSolveEngine final : public ISolveEngine {
  public:
    static constexpr int kSessionFd = 3;

    explicit ExecSolveEngine(ExecSolveEngineOptions opts);

    Result OpenSession(const LocalDirs& dirs, std::unique_ptr<ISessionTransport>& out) override;
    Result Solve(const SolveRequest& req, StatusChannel& status, std::stop_token st) override;

    // Sessions opened but not yet handed to a solver.
    std::size_t PendingSessions() const;

  private:
    void ReleasePeer(const std::string& session_id);

    Result Spawn(const std::string& session_id, Fd& peer, Fd& in, Fd& out, pid_t& pid) const;
    Result ReadStatus(int fd, StatusChannel& status, std::stop_token st) const;
    Result Reap(pid_t pid, std::stop_token st) const;
    void Terminate(pid_t pid) const;

    ExecSolveEngineOptions opts_;
    mutable std::mutex mu_;
    std::map<std::string, Fd> peers_;  // session id -> engine end of the socket
};

} // namespace imgbuild

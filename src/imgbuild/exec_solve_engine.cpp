#include "imgbuild/exec_solve_engine.hpp"

#include "imgbuild/status_codec.hpp"
#include "util/identity.hpp"
#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace imgbuild {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr std::size_t kMaxLineBytes = 16 * 1024 * 1024;

int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

// Waits for room on `fd` in short polls so a peer that never reads cannot
// hold off a stop request.
Result SendAll(int fd, std::string_view data, std::stop_token st = {}) {
    while (!data.empty()) {
        if (st.stop_requested()) return Result::Cancelled("send cancelled");

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        const int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return Result::Errno("poll");
        }
        if (rc == 0) continue;

        const ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return Result::Errno("send");
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return Result::Ok();
}

// Waits up to `timeout_ms` for `fd` to become readable. Returns false on
// timeout or EINTR.
bool WaitReadable(int fd, int timeout_ms, Result& err) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
        if (errno != EINTR) err = Result::Errno("poll");
        return false;
    }
    return rc > 0;
}

} // namespace

// --- SocketSession ---------------------------------------------------------

SocketSession::SocketSession(std::string id,
                             LocalDirs dirs,
                             Fd sock,
                             std::function<void(const std::string&)> on_release)
    : id_(std::move(id)), dirs_(std::move(dirs)), sock_(std::move(sock)), on_release_(std::move(on_release)) {}

SocketSession::~SocketSession() {
    if (on_release_) on_release_(id_);
}

std::string SocketSession::Answer(std::string_view request) const {
    constexpr std::string_view kDir = "dir ";
    if (request.rfind(kDir, 0) != 0) {
        return "error unsupported request";
    }
    const std::string name(request.substr(kDir.size()));
    auto it = dirs_.find(name);
    if (it == dirs_.end()) {
        return "error unknown directory " + name;
    }
    return "ok " + it->second;
}

Result SocketSession::Reply(const std::string& line) {
    return SendAll(sock_.Get(), line + "\n");
}

Result SocketSession::Run(std::stop_token st) {
    std::string pending;
    std::array<char, 4096> buf{};

    while (!closed_) {
        if (st.stop_requested()) return Result::Cancelled("session cancelled");

        Result err;
        if (!WaitReadable(sock_.Get(), kPollIntervalMs, err)) {
            if (!err.is_ok()) return err.Wrap("session " + id_);
            continue;
        }
        if (closed_) break;

        const ssize_t n = ::read(sock_.Get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Errno("session " + id_ + ": read");
        }
        if (n == 0) {
            LogDebug("session %s: peer closed", id_.c_str());
            break;
        }

        pending.append(buf.data(), static_cast<std::size_t>(n));
        std::size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            const std::string request = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            const std::string answer = Answer(request);
            LogDebug("session %s: %s -> %s", id_.c_str(), request.c_str(), answer.c_str());
            if (Result r = Reply(answer); !r.is_ok()) {
                if (closed_ || r.err == EPIPE || r.err == ECONNRESET) return Result::Ok();
                return r.Wrap("session " + id_);
            }
        }
        if (pending.size() > kMaxLineBytes) {
            return Result::Fail(EPROTO, "session " + id_ + ": request too long");
        }
    }
    return Result::Ok();
}

void SocketSession::Close() {
    if (closed_.exchange(true)) return;
    if (sock_.Valid()) ::shutdown(sock_.Get(), SHUT_RDWR);
}

// --- ExecSolveEngine -------------------------------------------------------

ExecSolveEngine::ExecSolveEngine(ExecSolveEngineOptions opts) : opts_(std::move(opts)) {}

Result ExecSolveEngine::OpenSession(const LocalDirs& dirs, std::unique_ptr<ISessionTransport>& out) {
    std::string id;
    if (Result r = NewId(id); !r.is_ok()) return r.Wrap("creating session id");

    Fd ours;
    Fd peer;
    if (Result r = Fd::SocketPair(ours, peer); !r.is_ok()) return r.Wrap("creating session");

    {
        std::lock_guard<std::mutex> lk(mu_);
        peers_.emplace(id, std::move(peer));
    }
    out = std::make_unique<SocketSession>(id, dirs, std::move(ours),
                                          [this](const std::string& sid) { ReleasePeer(sid); });
    LogDebug("session %s opened", id.c_str());
    return Result::Ok();
}

void ExecSolveEngine::ReleasePeer(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (peers_.erase(session_id) > 0) {
        LogDebug("session %s released before any solve", session_id.c_str());
    }
}

std::size_t ExecSolveEngine::PendingSessions() const {
    std::lock_guard<std::mutex> lk(mu_);
    return peers_.size();
}

Result ExecSolveEngine::Spawn(const std::string& session_id, Fd& peer, Fd& in, Fd& out, pid_t& pid) const {
    if (opts_.solver.empty()) return Result::Fail(EINVAL, "no solver configured");

    Fd child_in;
    if (Result r = Fd::SocketPair(in, child_in); !r.is_ok()) return r;
    Fd child_out;
    if (Result r = Fd::Pipe(out, child_out); !r.is_ok()) return r;

    // Everything the child touches is prepared before fork.
    std::vector<std::string> args;
    args.push_back(opts_.solver);
    args.insert(args.end(), opts_.solver_args.begin(), opts_.solver_args.end());
    std::vector<char*> c_args;
    c_args.reserve(args.size() + 1);
    for (auto& a : args) c_args.push_back(a.data());
    c_args.push_back(nullptr);

    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "IMGBUILD_SESSION_", 17) == 0) continue;
        env.emplace_back(*e);
    }
    env.push_back("IMGBUILD_SESSION_FD=" + std::to_string(kSessionFd));
    env.push_back("IMGBUILD_SESSION_ID=" + session_id);
    std::vector<char*> c_env;
    c_env.reserve(env.size() + 1);
    for (auto& e : env) c_env.push_back(e.data());
    c_env.push_back(nullptr);

    pid = ::fork();
    if (pid == -1) return Result::Errno("fork");

    if (pid == 0) {
        if (::dup2(child_in.Get(), STDIN_FILENO) == -1) ::_exit(126);
        if (::dup2(child_out.Get(), STDOUT_FILENO) == -1) ::_exit(126);
        if (peer.Get() == kSessionFd) {
            if (::fcntl(kSessionFd, F_SETFD, 0) == -1) ::_exit(126);
        } else if (::dup2(peer.Get(), kSessionFd) == -1) {
            ::_exit(126);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execvpe(c_args[0], c_args.data(), c_env.data());
        ::_exit(127);
    }

    return Result::Ok();
}

void ExecSolveEngine::Terminate(pid_t pid) const {
    int status;
    if (::waitpid(pid, &status, WNOHANG) == pid) return;

    ::kill(pid, SIGTERM);

    bool reaped = false;
    const int grace_ms = static_cast<int>(opts_.kill_grace.count());
    Fd pfd(pidfd_open(pid, 0));
    if (pfd.Valid()) {
        pollfd p{};
        p.fd = pfd.Get();
        p.events = POLLIN;
        if (::poll(&p, 1, grace_ms) > 0) {
            ::waitpid(pid, &status, 0);
            reaped = true;
        }
    } else {
        for (int waited = 0; waited < grace_ms; waited += kPollIntervalMs) {
            if (::waitpid(pid, &status, WNOHANG) == pid) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }
    }

    if (!reaped) {
        LogWarn("solver %d ignored SIGTERM, killing", static_cast<int>(pid));
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
    }
}

Result ExecSolveEngine::ReadStatus(int fd, StatusChannel& status, std::stop_token st) const {
    std::string pending;
    std::array<char, 64 * 1024> buf{};

    auto flush_line = [&](const std::string& line) -> Result {
        if (line.find_first_not_of(" \t\r") == std::string::npos) return Result::Ok();
        auto resp = DecodeStatusLine(line);
        if (!resp) return Result::Fail(EPROTO, "solver status: " + resp.error());
        if (!status.Send(std::move(*resp), st)) {
            if (st.stop_requested()) return Result::Cancelled("solve cancelled");
            return Result::Fail(EPIPE, "status consumer went away");
        }
        return Result::Ok();
    };

    while (true) {
        if (st.stop_requested()) return Result::Cancelled("solve cancelled");

        Result err;
        if (!WaitReadable(fd, kPollIntervalMs, err)) {
            if (!err.is_ok()) return err;
            continue;
        }

        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Errno("reading solver output");
        }
        if (n == 0) break;

        pending.append(buf.data(), static_cast<std::size_t>(n));
        std::size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            const std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (Result r = flush_line(line); !r.is_ok()) return r;
        }
        if (pending.size() > kMaxLineBytes) {
            return Result::Fail(EPROTO, "solver status line too long");
        }
    }
    return flush_line(pending);
}

Result ExecSolveEngine::Reap(pid_t pid, std::stop_token st) const {
    int status = 0;
    while (true) {
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) break;
        if (rc < 0 && errno != EINTR) {
            return Result::Errno("waitpid");
        }
        if (st.stop_requested()) {
            Terminate(pid);
            return Result::Cancelled("solve cancelled");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }

    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == 0) return Result::Ok();
        if (code == 127) return Result::Fail(ENOENT, "cannot execute solver " + opts_.solver);
        return Result::Fail(EIO, "solver exited with status " + std::to_string(code));
    }
    if (WIFSIGNALED(status)) {
        return Result::Fail(EIO, "solver killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return Result::Fail(EIO, "solver ended abnormally");
}

Result ExecSolveEngine::Solve(const SolveRequest& req, StatusChannel& status, std::stop_token st) {
    Fd peer;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = peers_.find(req.session_id);
        if (it == peers_.end()) {
            return Result::Fail(EINVAL, "unknown session " + req.session_id);
        }
        peer = std::move(it->second);
        peers_.erase(it);
    }

    Fd in;
    Fd out;
    pid_t pid = -1;
    if (Result r = Spawn(req.session_id, peer, in, out, pid); !r.is_ok()) {
        return r.Wrap("starting solver");
    }
    // The child holds its own copy now.
    (void)peer.Close();
    LogInfo("solver %s started (pid %d, ref %s)", opts_.solver.c_str(), static_cast<int>(pid), req.ref.c_str());

    const std::string doc = EncodeSolveRequest(req, opts_.state_dir, opts_.backend);
    Result sent = SendAll(in.Get(), doc + "\n", st);
    ::shutdown(in.Get(), SHUT_WR);
    if (!sent.is_ok() && sent.err != EPIPE && sent.err != ECONNRESET) {
        Terminate(pid);
        return sent.Wrap("sending solve request");
    }

    Result read_res = ReadStatus(out.Get(), status, st);
    if (!read_res.is_ok()) {
        Terminate(pid);
        return read_res;
    }
    return Reap(pid, st);
}

} // namespace imgbuild

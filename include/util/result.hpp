#pragma once
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace imgbuild {

// Outcome of a build step. `err` is an errno value where one applies, -1 for
// failures without a system cause.
struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    bool is_cancelled() const { return !ok && err == ECANCELED; }
    const std::string& message() const { return msg; }

    // Prefix the message with the step that failed, keep the code.
    Result Wrap(const std::string& step) const {
        if (ok) return *this;
        return {.ok = false, .err = err, .msg = step + ": " + msg};
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result Cancelled(std::string m) {
        return {.ok = false, .err = ECANCELED, .msg = std::move(m)};
    }
    // Failure from the current errno: "<what>: <strerror>".
    static Result Errno(const std::string& what) {
        const int e = errno;
        return Errno(e, what);
    }
    static Result Errno(int e, const std::string& what) {
        return {.ok = false, .err = e, .msg = what + ": " + std::strerror(e)};
    }
};

} // namespace imgbuild

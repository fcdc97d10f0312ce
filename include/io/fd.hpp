#pragma once

#include "util/result.hpp"

namespace imgbuild {

// Owns one descriptor. Standard input is never closed, so a reader over "-"
// can hold it like any other.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd);
    // Give up ownership without closing.
    int Release();
    // Returns the close(2) result so writers can report deferred I/O errors.
    int Close();

    // Both ends are close-on-exec; a child gets its end through dup2.
    static Result Pipe(Fd& read_end, Fd& write_end);
    static Result SocketPair(Fd& a, Fd& b);

  private:
    int fd_{-1};
};

} // namespace imgbuild

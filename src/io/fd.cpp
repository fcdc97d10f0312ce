#include "io/fd.hpp"

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace imgbuild {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) Reset(other.Release());
    return *this;
}

Fd::~Fd() { (void)Close(); }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

int Fd::Close() {
    int rc = 0;
    if (fd_ >= 0 && fd_ != STDIN_FILENO) rc = ::close(fd_);
    fd_ = -1;
    return rc;
}

Result Fd::Pipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return Result::Errno("pipe");
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

Result Fd::SocketPair(Fd& a, Fd& b) {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) return Result::Errno("socketpair");
    a.Reset(fds[0]);
    b.Reset(fds[1]);
    return Result::Ok();
}

} // namespace imgbuild

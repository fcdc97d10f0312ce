#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace imgbuild {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);
    out.size_ = std::nullopt;
    out.error_.clear();

    if (out.IsStdin()) {
        out.fd_.Reset(STDIN_FILENO);
        return Result::Ok();
    }

    Fd fd(::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) return Result::Errno("open " + out.path_);

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) return Result::Errno("stat " + out.path_);
    if (S_ISDIR(st.st_mode)) return Result::Errno(EISDIR, "open " + out.path_);
    if (S_ISREG(st.st_mode)) out.size_ = static_cast<std::uint64_t>(st.st_size);

    out.fd_ = std::move(fd);
    return Result::Ok();
}

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) return n;
        if (errno == EINTR) continue;
        error_ = "reading " + Name() + ": " + std::strerror(errno);
        return -1;
    }
}

} // namespace imgbuild

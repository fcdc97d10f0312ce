#include "io/file_writer.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace imgbuild {

Result FileWriter::Create(std::string path, mode_t mode, FileWriter& out) {
    out.path_ = std::move(path);

    const int flags = O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC;
    int fd = ::open(out.path_.c_str(), flags, mode);
    if (fd < 0) {
        return Result::Errno("create " + out.path_);
    }
    out.fd_.Reset(fd);

    // open(2) filters the mode through the umask; the caller asked for exact bits.
    if (::fchmod(fd, mode) != 0) {
        return Result::Errno("chmod " + out.path_);
    }
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == 0) return Result::Fail(EIO, "write " + path_ + ": no progress");
        return Result::Errno("write " + path_);
    }

    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    if (fd_.Close() != 0) {
        return Result::Errno("close " + path_);
    }
    return Result::Ok();
}

Result CopyAll(IReader& r, IWriter& w, std::uint64_t* copied) {
    std::vector<std::uint8_t> buffer(64 * 1024);
    std::uint64_t total = 0;

    while (true) {
        const ssize_t n = r.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) {
            if (copied) *copied = total;
            const std::string why = r.Error();
            return Result::Fail(EIO, why.empty() ? std::string("read failed during copy") : why);
        }

        auto res = w.WriteAll({buffer.data(), static_cast<size_t>(n)});
        if (!res.is_ok()) {
            if (copied) *copied = total;
            return res;
        }
        total += static_cast<std::uint64_t>(n);
    }

    if (copied) *copied = total;
    return Result::Ok();
}

} // namespace imgbuild

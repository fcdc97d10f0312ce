#include "util/temp_path.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace imgbuild {

namespace {

std::vector<char> Template(const std::string& base_dir, const std::string& prefix) {
    std::string tmpl = base_dir;
    if (tmpl.empty() || tmpl.back() != '/') tmpl.push_back('/');
    tmpl += prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    return buf;
}

} // namespace

std::string TempBaseDir(const std::string& preferred) {
    if (!preferred.empty()) return preferred;
    const char* env = std::getenv("TMPDIR");
    if (env && *env) return env;
    return "/tmp";
}

Result TempFile::Create(const std::string& base_dir, const std::string& prefix, TempFile& out) {
    auto buf = Template(base_dir, prefix);
    const int fd = ::mkostemp(buf.data(), O_CLOEXEC);
    if (fd < 0) {
        return Result::Errno("mkstemp in " + base_dir);
    }
    out = TempFile();
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

Result TempFile::Close() {
    if (!fd_.Valid()) return Result::Ok();
    if (fd_.Close() != 0) {
        return Result::Errno("close " + path_);
    }
    return Result::Ok();
}

std::string TempFile::Release() {
    (void)fd_.Close();
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

void TempFile::Cleanup() {
    (void)fd_.Close();
    if (!path_.empty()) {
        LogDebug("removing temporary file %s", path_.c_str());
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result TempDirectory::Create(const std::string& base_dir,
                             const std::string& prefix,
                             TempDirectory& out) {
    auto buf = Template(base_dir, prefix);
    char* created = ::mkdtemp(buf.data());
    if (!created) {
        return Result::Errno("mkdtemp in " + base_dir);
    }
    out = TempDirectory();
    out.path_ = created;
    return Result::Ok();
}

TempDirectory::TempDirectory() = default;
TempDirectory::TempDirectory(TempDirectory&& other) noexcept { *this = std::move(other); }
TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempDirectory::~TempDirectory() { Cleanup(); }

const std::string& TempDirectory::Path() const { return path_; }

std::string TempDirectory::Release() {
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

void TempDirectory::Cleanup() {
    if (path_.empty()) return;
    LogDebug("removing temporary directory %s", path_.c_str());
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::path(path_), ec);
    if (ec) {
        LogWarn("failed to remove %s: %s", path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

} // namespace imgbuild

#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace imgbuild {

// Directory used for temporary files: `preferred` when set, else $TMPDIR,
// else /tmp.
std::string TempBaseDir(const std::string& preferred = {});

// Owns a file created with mkstemp; the file is unlinked on destruction
// unless Release() was called.
class TempFile {
public:
    static Result Create(const std::string& base_dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    Result Close();
    std::string Release();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

// Owns a directory created with mkdtemp; the whole tree is removed on
// destruction unless Release() was called.
class TempDirectory {
public:
    static Result Create(const std::string& base_dir, const std::string& prefix, TempDirectory& out);

    TempDirectory();
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    ~TempDirectory();

    const std::string& Path() const;
    std::string Release();

private:
    void Cleanup();

    std::string path_;
};

} // namespace imgbuild

#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace imgbuild {

// Recipe or context path meaning "read it from standard input".
inline constexpr char kStdinPath[] = "-";

// Reads a regular file, or standard input when the path is "-". Directories
// are refused at Open so a mistyped recipe path fails before any build work.
class FileOrStdinReader final : public IReader {
  public:
    static Result Open(std::string path, FileOrStdinReader& out);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::string Error() const override { return error_; }

    const std::string& Path() const { return path_; }
    bool IsStdin() const { return path_ == kStdinPath; }

  private:
    std::string Name() const { return IsStdin() ? std::string("stdin") : path_; }

    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    std::string error_;
};

} // namespace imgbuild

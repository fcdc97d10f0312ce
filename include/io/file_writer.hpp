#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace imgbuild {

// Creates or truncates a regular file. The final path component is never
// followed if it is a symlink.
class FileWriter final : public IWriter {
  public:
    static Result Create(std::string path, mode_t mode, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace imgbuild

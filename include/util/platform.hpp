#pragma once

#include <string>
#include <string_view>

namespace imgbuild {

// OCI platform string of the running host, "os/arch[/variant]", e.g.
// "linux/amd64" or "linux/arm64/v8".
std::string DefaultPlatform();

// Maps a uname(2) machine name to "arch[/variant]". Unknown names pass through.
std::string NormalizeArch(std::string_view machine);

} // namespace imgbuild

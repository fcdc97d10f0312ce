#include "util/platform.hpp"

#include <sys/utsname.h>

namespace imgbuild {

std::string NormalizeArch(std::string_view machine) {
    if (machine == "x86_64" || machine == "amd64") return "amd64";
    if (machine == "i386" || machine == "i486" || machine == "i586" || machine == "i686") return "386";
    if (machine == "aarch64" || machine == "arm64") return "arm64/v8";
    if (machine == "armv8l") return "arm/v8";
    if (machine == "armv7l" || machine == "armv7") return "arm/v7";
    if (machine == "armv6l" || machine == "armv6") return "arm/v6";
    if (machine == "armv5tel" || machine == "armv5l") return "arm/v5";
    return std::string(machine);
}

std::string DefaultPlatform() {
    struct utsname u{};
    if (::uname(&u) != 0) {
#if defined(__x86_64__)
        return "linux/amd64";
#elif defined(__aarch64__)
        return "linux/arm64/v8";
#else
        return "linux/unknown";
#endif
    }
    return "linux/" + NormalizeArch(u.machine);
}

} // namespace imgbuild

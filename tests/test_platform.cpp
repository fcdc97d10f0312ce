#include "util/platform.hpp"

#include <gtest/gtest.h>

namespace imgbuild {
namespace {

TEST(PlatformTest, NormalizesMachineNames) {
    EXPECT_EQ(NormalizeArch("x86_64"), "amd64");
    EXPECT_EQ(NormalizeArch("aarch64"), "arm64/v8");
    EXPECT_EQ(NormalizeArch("armv7l"), "arm/v7");
    EXPECT_EQ(NormalizeArch("riscv64"), "riscv64");
}

TEST(PlatformTest, DefaultIsLinuxWithSingleValue) {
    const std::string p = DefaultPlatform();
    EXPECT_EQ(p.rfind("linux/", 0), 0u);
    EXPECT_EQ(p.find(','), std::string::npos);
}

} // namespace
} // namespace imgbuild

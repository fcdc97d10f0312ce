#include "io/peek_reader.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace imgbuild {
namespace {

std::string AsString(std::span<const std::uint8_t> s) {
    return std::string(reinterpret_cast<const char*>(s.data()), s.size());
}

TEST(PeekReaderTest, PeekedBytesAreReadAgain) {
    testutil::MemoryReader src(std::string("0123456789abcdef"));
    src.SetChunkSize(3);
    PeekReader peek(src);

    std::span<const std::uint8_t> head;
    ASSERT_TRUE(peek.Peek(8, head).is_ok());
    EXPECT_EQ(AsString(head), "01234567");

    EXPECT_EQ(testutil::ReadAll(peek), "0123456789abcdef");
}

TEST(PeekReaderTest, ShortStreamIsNotAnError) {
    testutil::MemoryReader src(std::string("abc"));
    PeekReader peek(src);

    std::span<const std::uint8_t> head;
    ASSERT_TRUE(peek.Peek(512, head).is_ok());
    EXPECT_EQ(AsString(head), "abc");
    EXPECT_EQ(testutil::ReadAll(peek), "abc");
}

TEST(PeekReaderTest, EmptyStream) {
    testutil::MemoryReader src{std::string()};
    PeekReader peek(src);

    std::span<const std::uint8_t> head;
    ASSERT_TRUE(peek.Peek(512, head).is_ok());
    EXPECT_TRUE(head.empty());

    std::array<std::uint8_t, 16> buf{};
    EXPECT_EQ(peek.Read(buf), 0);
}

TEST(PeekReaderTest, SourceErrorFailsPeek) {
    testutil::MemoryReader src(std::string(100, 'x'));
    src.FailAt(0);
    PeekReader peek(src);

    std::span<const std::uint8_t> head;
    auto r = peek.Peek(16, head);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("injected read failure"), std::string::npos) << r.msg;
    EXPECT_EQ(peek.Error(), src.Error());
}

} // namespace
} // namespace imgbuild

#include "util/identity.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cstdint>

namespace imgbuild {

namespace {

constexpr size_t kIdLength = 25;
constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

// Divides the big-endian number in `num` by `divisor` in place, returning the remainder.
unsigned DivMod(std::array<std::uint8_t, 16>& num, unsigned divisor) {
    unsigned rem = 0;
    for (auto& byte : num) {
        const unsigned cur = (rem << 8) | byte;
        byte = static_cast<std::uint8_t>(cur / divisor);
        rem = cur % divisor;
    }
    return rem;
}

} // namespace

Result NewId(std::string& out) {
    std::array<std::uint8_t, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        char buf[256]{};
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        return Result::Fail(-1, std::string("RAND_bytes failed: ") + buf);
    }

    out.assign(kIdLength, '0');
    for (size_t i = kIdLength; i-- > 0;) {
        out[i] = kAlphabet[DivMod(raw, 36)];
    }
    return Result::Ok();
}

} // namespace imgbuild

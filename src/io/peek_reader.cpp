#include "io/peek_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

namespace imgbuild {

Result PeekReader::Peek(size_t n, std::span<const std::uint8_t>& out) {
    // Compact already consumed bytes so the window starts at the read position.
    if (pos_ > 0) {
        buffered_.erase(buffered_.begin(), buffered_.begin() + static_cast<std::ptrdiff_t>(pos_));
        pos_ = 0;
    }

    while (buffered_.size() < n && !source_eof_) {
        const size_t have = buffered_.size();
        buffered_.resize(n);
        const ssize_t r = source_->Read(std::span<std::uint8_t>(buffered_.data() + have, n - have));
        if (r < 0) {
            buffered_.resize(have);
            const std::string why = source_->Error();
            return Result::Fail(EIO, "peek: " + (why.empty() ? std::string("read error") : why));
        }
        buffered_.resize(have + static_cast<size_t>(r));
        if (r == 0) source_eof_ = true;
    }

    out = std::span<const std::uint8_t>(buffered_.data(), std::min(n, buffered_.size()));
    return Result::Ok();
}

ssize_t PeekReader::Read(std::span<std::uint8_t> out) {
    if (pos_ < buffered_.size()) {
        const size_t n = std::min(out.size(), buffered_.size() - pos_);
        std::memcpy(out.data(), buffered_.data() + pos_, n);
        pos_ += n;
        if (pos_ == buffered_.size()) {
            buffered_.clear();
            pos_ = 0;
        }
        return static_cast<ssize_t>(n);
    }
    if (source_eof_) return 0;
    return source_->Read(out);
}

} // namespace imgbuild

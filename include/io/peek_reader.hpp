#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace imgbuild {

// Buffers a prefix of another reader so it can be inspected and then read
// again. Mirrors the look-ahead a buffered reader offers.
class PeekReader final : public IReader {
  public:
    explicit PeekReader(IReader& source) : source_(&source) {}

    // Returns up to `n` bytes from the front of the stream without consuming
    // them. Fewer bytes are returned only when the source ended first.
    // Fails if the source reports an error.
    Result Peek(size_t n, std::span<const std::uint8_t>& out);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return source_->TotalSize(); }
    std::string Error() const override { return source_->Error(); }

  private:
    IReader* source_ = nullptr;
    std::vector<std::uint8_t> buffered_;
    size_t pos_ = 0;
    bool source_eof_ = false;
};

} // namespace imgbuild

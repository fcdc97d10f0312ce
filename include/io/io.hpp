#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>

namespace imgbuild {

// Byte source for recipes, contexts and archive entries.
// Read returns the number of bytes produced, 0 at end of stream, -1 on error;
// after -1, Error() says what went wrong.
class IReader {
  public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
    // Description of the last failure, empty when none.
    virtual std::string Error() const { return {}; }
};

class IWriter {
  public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
};

// Copy reader to writer until end of stream. `copied` receives the byte count
// even when the copy fails part way. A read failure carries the reader's Error().
Result CopyAll(IReader& r, IWriter& w, std::uint64_t* copied = nullptr);

} // namespace imgbuild

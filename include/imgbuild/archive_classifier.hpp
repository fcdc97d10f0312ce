#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace imgbuild {

// Size of one tar header block; the classifier never needs more.
inline constexpr std::size_t kArchiveHeaderSize = 512;

enum class Compression {
    None,
    Gzip,
    Bzip2,
    Xz,
    Zstd,
};

const char* CompressionName(Compression c);

// Recognizes a compression envelope from its magic bytes.
Compression DetectCompression(std::span<const std::uint8_t> header);

// True when `header` (the first bytes of a stream, at most one header block)
// starts a compressed stream or a tar archive. Short or empty input is not an
// error; it simply fails to parse as a tar header. Prefers false negatives:
// a plain file is never reported as an archive.
bool IsArchive(std::span<const std::uint8_t> header);

} // namespace imgbuild

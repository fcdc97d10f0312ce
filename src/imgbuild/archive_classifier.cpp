#include "imgbuild/archive_classifier.hpp"

#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <memory>

namespace imgbuild {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct Magic {
    Compression kind;
    std::span<const std::uint8_t> bytes;
};

constexpr std::array<std::uint8_t, 3> kGzipMagic{0x1F, 0x8B, 0x08};
constexpr std::array<std::uint8_t, 3> kBzip2Magic{0x42, 0x5A, 0x68};
constexpr std::array<std::uint8_t, 6> kXzMagic{0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00};
constexpr std::array<std::uint8_t, 4> kZstdMagic{0x28, 0xB5, 0x2F, 0xFD};

bool HasPrefix(std::span<const std::uint8_t> data, std::span<const std::uint8_t> prefix) {
    return data.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), data.begin());
}

// Tries to read exactly one tar entry header out of `header`.
bool ParsesAsTarHeader(std::span<const std::uint8_t> header) {
    if (header.empty()) return false;

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return false;

    archive_read_support_format_tar(ar.get());
    if (archive_read_open_memory(ar.get(), header.data(), header.size()) != ARCHIVE_OK) {
        return false;
    }

    archive_entry* entry = nullptr;
    return archive_read_next_header(ar.get(), &entry) == ARCHIVE_OK;
}

} // namespace

const char* CompressionName(Compression c) {
    switch (c) {
        case Compression::None:  return "none";
        case Compression::Gzip:  return "gzip";
        case Compression::Bzip2: return "bzip2";
        case Compression::Xz:    return "xz";
        case Compression::Zstd:  return "zstd";
    }
    return "unknown";
}

Compression DetectCompression(std::span<const std::uint8_t> header) {
    const Magic table[] = {
        {Compression::Gzip, kGzipMagic},
        {Compression::Bzip2, kBzip2Magic},
        {Compression::Xz, kXzMagic},
        {Compression::Zstd, kZstdMagic},
    };
    for (const auto& m : table) {
        if (HasPrefix(header, m.bytes)) return m.kind;
    }
    return Compression::None;
}

bool IsArchive(std::span<const std::uint8_t> header) {
    const Compression c = DetectCompression(header);
    if (c != Compression::None) {
        LogDebug("stream starts with a %s envelope", CompressionName(c));
        return true;
    }
    return ParsesAsTarHeader(header.first(std::min(header.size(), kArchiveHeaderSize)));
}

} // namespace imgbuild

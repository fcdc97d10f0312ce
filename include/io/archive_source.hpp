#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <cstdint>
#include <string>
#include <vector>

namespace imgbuild {

// Feeds an IReader into libarchive. The source must outlive the archive
// handle it was opened on; libarchive does not own it.
class ArchiveSource {
  public:
    explicit ArchiveSource(IReader& reader, size_t buffer_size = 64 * 1024)
        : reader_(&reader), buffer_(buffer_size) {}

    ArchiveSource(const ArchiveSource&) = delete;
    ArchiveSource& operator=(const ArchiveSource&) = delete;

    int Open(struct archive* ar);

  private:
    static la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf);

    IReader* reader_ = nullptr;
    std::vector<std::uint8_t> buffer_;
};

std::string ArchiveErr(struct archive* ar);

} // namespace imgbuild

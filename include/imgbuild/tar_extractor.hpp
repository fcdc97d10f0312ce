#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace imgbuild {

struct ExtractStats {
    std::uint64_t directories = 0;
    std::uint64_t files = 0;
    std::uint64_t skipped = 0;
    std::uint64_t bytes = 0;
};

// Unpacks a tar stream, optionally gzip/bzip2/xz/zstd compressed, into an
// existing directory. Only directories and regular files are materialized;
// every other entry type is skipped. Any entry name that would resolve
// outside the destination aborts the whole extraction.
class TarExtractor {
  public:
    TarExtractor() = default;

    Result Extract(IReader& tar_stream,
                   const std::string& dst_dir,
                   ExtractStats* stats = nullptr) const;
};

} // namespace imgbuild

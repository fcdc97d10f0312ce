#pragma once

#include "io/io.hpp"

#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

namespace imgbuild {

// Streams the inflated bytes of a gzip member. A source that ends before the
// gzip trailer is reported as an error, not as end of stream.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    // Non-owning variant; `source` must outlive the reader.
    explicit GzipReader(IReader& source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

    std::string Error() const override { return error_; }

  private:
    void Init();
    ssize_t Fail(std::string msg);

    std::unique_ptr<IReader> owned_;
    IReader* source_ = nullptr;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    std::string error_;
    bool eof_reached_ = false;
    bool failed_ = false;
};

} // namespace imgbuild

#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace imgbuild {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : owned_(std::move(source)), source_(owned_.get()), in_buffer_(64 * 1024) {
    Init();
}

GzipReader::GzipReader(IReader& source) : source_(&source), in_buffer_(64 * 1024) {
    Init();
}

void GzipReader::Init() {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Fail(std::string msg) {
    failed_ = true;
    error_ = std::move(msg);
    return -1;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (failed_) return -1;
    if (eof_reached_ || out.empty()) return 0;
    if (!source_) return Fail("gzip: no source");

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) {
                const std::string why = source_->Error();
                return Fail("gzip: reading compressed input: " + (why.empty() ? std::string("read error") : why));
            }
            if (n == 0) {
                if (strm_.avail_out != out.size()) break;
                return Fail("gzip: unexpected end of compressed stream");
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        const int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            eof_reached_ = true;
            break;
        }

        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return Fail(std::string("gzip: ") + (strm_.msg ? strm_.msg : "inflate failed"));
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace imgbuild

#include "io/archive_source.hpp"

#include "system/signals.hpp"

#include <cerrno>

namespace imgbuild {

la_ssize_t ArchiveSource::ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    if (g_cancel.load(std::memory_order_relaxed)) {
        archive_set_error(ar, EINTR, "interrupted");
        return -1;
    }

    auto* self = static_cast<ArchiveSource*>(client_data);
    const ssize_t n = self->reader_->Read(std::span<std::uint8_t>(self->buffer_.data(), self->buffer_.size()));
    if (n < 0) {
        const std::string why = self->reader_->Error();
        archive_set_error(ar, EIO, "%s", why.empty() ? "read from input stream failed" : why.c_str());
        return -1;
    }

    *out_buf = self->buffer_.data();
    return static_cast<la_ssize_t>(n);
}

int ArchiveSource::Open(struct archive* ar) {
    return archive_read_open2(ar, this, nullptr, &ArchiveSource::ReadCb, nullptr, nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace imgbuild

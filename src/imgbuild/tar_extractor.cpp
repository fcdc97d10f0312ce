#include "imgbuild/tar_extractor.hpp"

#include "imgbuild/archive_classifier.hpp"
#include "imgbuild/secure_join.hpp"
#include "io/archive_source.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "io/peek_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/stat.h>

namespace imgbuild {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

// Streams the data of the entry libarchive is positioned on.
class EntryReader final : public IReader {
  public:
    explicit EntryReader(archive* ar) : ar_(ar) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const la_ssize_t n = archive_read_data(ar_, out.data(), out.size());
        if (n < 0) {
            failed_ = true;
            return -1;
        }
        return static_cast<ssize_t>(n);
    }

    bool Failed() const { return failed_; }
    std::string Error() const override { return failed_ ? ArchiveErr(ar_) : std::string(); }

  private:
    archive* ar_ = nullptr;
    bool failed_ = false;
};

// mkdir -p. Existing directories are left exactly as they are.
Result MkdirAll(const std::string& path, mode_t mode) {
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return Result::Ok();
        return Result::Fail(ENOTDIR, "not a directory: " + path);
    }

    const std::string parent = PathDir(path);
    if (parent != path) {
        auto pr = MkdirAll(parent, mode);
        if (!pr.is_ok()) return pr;
    }

    if (::mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        return Result::Errno("mkdir " + path);
    }
    return Result::Ok();
}

Result WriteRegularFile(archive* ar, const std::string& target, mode_t mode, std::uint64_t& bytes) {
    auto pr = MkdirAll(PathDir(target), 0755);
    if (!pr.is_ok()) return pr;

    FileWriter writer;
    auto cr = FileWriter::Create(target, mode, writer);
    if (!cr.is_ok()) return cr;

    EntryReader entry_reader(ar);
    auto copy = CopyAll(entry_reader, writer, &bytes);
    if (!copy.is_ok() && entry_reader.Failed()) copy = copy.Wrap("reading entry data");

    // Close right after the copy, whatever its outcome.
    auto close = writer.Close();
    if (!copy.is_ok()) return copy;
    return close;
}

} // namespace

Result TarExtractor::Extract(IReader& tar_stream,
                             const std::string& dst_dir,
                             ExtractStats* stats) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(fs::path(dst_dir), ec) || ec) {
        return Result::Fail(-1, "destination is not a directory: " + dst_dir);
    }

    PeekReader peek(tar_stream);
    std::span<const std::uint8_t> head;
    auto peek_res = peek.Peek(kArchiveHeaderSize, head);
    if (!peek_res.is_ok()) return peek_res;

    const Compression compression = DetectCompression(head);
    LogDebug("extract: compression=%s dst=%s", CompressionName(compression), dst_dir.c_str());

    std::unique_ptr<GzipReader> gzip;
    IReader* source = &peek;
    if (compression == Compression::Gzip) {
        try {
            gzip = std::make_unique<GzipReader>(peek);
        } catch (const std::exception& e) {
            return Result::Fail(-1, std::string("gzip init failed: ") + e.what());
        }
        source = gzip.get();
    }

    // Declared before `ar` so the handle is freed before the source it reads.
    ArchiveSource archive_source(*source);

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_format_tar(ar.get());
    (void)archive_read_support_filter_bzip2(ar.get());
    (void)archive_read_support_filter_xz(ar.get());
    (void)archive_read_support_filter_zstd(ar.get());

    if (archive_source.Open(ar.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "opening archive: " + ArchiveErr(ar.get()));
    }

    ExtractStats local{};
    ExtractStats& st = stats ? *stats : local;
    st = ExtractStats{};

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("extract: %s", ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return Result::Fail(-1, "reading archive header: " + ArchiveErr(ar.get()));
        }

        const char* raw_name = entry ? archive_entry_pathname(entry) : nullptr;
        if (!raw_name) {
            ++st.skipped;
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        std::string target;
        auto join = SecureJoin(dst_dir, raw_name, target);
        if (!join.is_ok()) return join.Wrap("extracting " + std::string(raw_name));

        const mode_t type = archive_entry_filetype(entry);
        const bool hardlink = archive_entry_hardlink(entry) != nullptr;

        if (type == AE_IFDIR) {
            LogDebug("extract: dir  %s", raw_name);
            auto mk = MkdirAll(target, 0755);
            if (!mk.is_ok()) return mk.Wrap("extracting " + std::string(raw_name));
            ++st.directories;
        } else if (type == AE_IFREG && !hardlink) {
            LogDebug("extract: file %s", raw_name);
            const mode_t mode = archive_entry_perm(entry) & 0777;
            std::uint64_t written = 0;
            auto wr = WriteRegularFile(ar.get(), target, mode, written);
            st.bytes += written;
            if (!wr.is_ok()) return wr.Wrap("extracting " + std::string(raw_name));
            ++st.files;
        } else {
            LogDebug("extract: skip %s (type 0%o)", raw_name, static_cast<unsigned>(type));
            ++st.skipped;
        }
        // Consumes whatever the entry did not read; no-op after a full copy.
        (void)archive_read_data_skip(ar.get());
    }

    LogDebug("extract: %llu dirs, %llu files, %llu skipped, %llu bytes",
             (unsigned long long)st.directories,
             (unsigned long long)st.files,
             (unsigned long long)st.skipped,
             (unsigned long long)st.bytes);
    return Result::Ok();
}

} // namespace imgbuild

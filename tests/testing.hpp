#pragma once

#include "imgbuild/solve_engine.hpp"
#include "imgbuild/status_display.hpp"
#include "io/io.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/imgbuild_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string Join(const std::string& rel) const { return path_ + "/" + rel; }

  private:
    std::string path_;
};

class MemoryReader final : public imgbuild::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    // Caps every Read() at `n` bytes to exercise short reads.
    void SetChunkSize(size_t n) { chunk_ = n; }

    // Makes Read() fail once `offset` bytes have been delivered.
    void FailAt(size_t offset) { fail_at_ = offset; }

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (fail_at_ && pos_ >= *fail_at_) {
            error_ = "injected read failure at " + std::to_string(pos_);
            return -1;
        }
        if (pos_ >= data_.size())
            return 0;
        size_t n = std::min(out.size(), data_.size() - pos_);
        if (chunk_)
            n = std::min(n, chunk_);
        if (fail_at_)
            n = std::min(n, *fail_at_ - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

    std::string Error() const override { return error_; }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
    size_t chunk_ = 0;
    std::optional<size_t> fail_at_;
    std::string error_;
};

struct TarEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
    mode_t perm = 0644;
    std::string link_target;  // symlinks and hardlinks
};

enum class TarFilter { None, Gzip, Bzip2 };

inline std::vector<std::uint8_t> BuildTar(const std::vector<TarEntry>& entries,
                                          TarFilter filter = TarFilter::None) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format_pax_restricted failed");
    }
    int fr = ARCHIVE_OK;
    if (filter == TarFilter::Gzip)
        fr = archive_write_add_filter_gzip(a);
    else if (filter == TarFilter::Bzip2)
        fr = archive_write_add_filter_bzip2(a);
    if (fr != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_add_filter failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.perm);
        if (entry.file_type == AE_IFLNK)
            archive_entry_set_symlink(hdr, entry.link_target.c_str());
        else if (!entry.link_target.empty())
            archive_entry_set_hardlink(hdr, entry.link_target.c_str());
        const bool has_data = entry.file_type == AE_IFREG && entry.link_target.empty();
        archive_entry_set_size(hdr, has_data ? static_cast<la_int64_t>(entry.contents.size()) : 0);
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (has_data && !entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline std::string ReadAll(imgbuild::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    std::stringstream ss;
    ss << is.rdbuf();
    return ss.str();
}

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    os << contents;
}

inline mode_t PermBits(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0)
        throw std::runtime_error("stat failed: " + path);
    return st.st_mode & 07777;
}

inline std::vector<std::uint8_t> Bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

// Display that keeps every batch it receives.
class RecordingDisplay final : public imgbuild::IStatusDisplay {
  public:
    imgbuild::Result OnStatus(const imgbuild::SolveStatus& status) override {
        std::lock_guard<std::mutex> lk(mu_);
        batches_.push_back(status);
        if (fail_after_ && batches_.size() >= *fail_after_)
            return imgbuild::Result::Fail(EIO, "display broke");
        return imgbuild::Result::Ok();
    }

    imgbuild::Result Finish() override {
        finished_ = true;
        return imgbuild::Result::Ok();
    }

    void FailAfter(size_t n) { fail_after_ = n; }

    std::vector<imgbuild::SolveStatus> Batches() const {
        std::lock_guard<std::mutex> lk(mu_);
        return batches_;
    }
    bool Finished() const { return finished_; }

  private:
    mutable std::mutex mu_;
    std::vector<imgbuild::SolveStatus> batches_;
    std::optional<size_t> fail_after_;
    std::atomic_bool finished_{false};
};

// Session that blocks until closed or stopped.
class FakeSession final : public imgbuild::ISessionTransport {
  public:
    FakeSession(std::string id, std::atomic_int* closes = nullptr) : id_(std::move(id)), closes_(closes) {}

    const std::string& Id() const override { return id_; }

    imgbuild::Result Run(std::stop_token st) override {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, st, [&] { return closed_ || fail_; });
        if (fail_) return imgbuild::Result::Fail(ECONNRESET, "session dropped");
        if (closed_) return imgbuild::Result::Ok();
        return imgbuild::Result::Cancelled("session cancelled");
    }

    void Close() override {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        if (closes_) ++*closes_;
        cv_.notify_all();
    }

    void Drop() {
        std::lock_guard<std::mutex> lk(mu_);
        fail_ = true;
        cv_.notify_all();
    }

  private:
    std::string id_;
    mutable std::mutex mu_;
    std::condition_variable_any cv_;
    bool closed_ = false;
    bool fail_ = false;
    std::atomic_int* closes_ = nullptr;
};

// Engine driven by a test-supplied solve function.
class FakeEngine final : public imgbuild::ISolveEngine {
  public:
    using SolveFn = std::function<imgbuild::Result(const imgbuild::SolveRequest&,
                                                   imgbuild::StatusChannel&,
                                                   std::stop_token)>;

    explicit FakeEngine(SolveFn fn) : fn_(std::move(fn)) {}

    imgbuild::Result OpenSession(const imgbuild::LocalDirs& dirs,
                                 std::unique_ptr<imgbuild::ISessionTransport>& out) override {
        if (open_error_) return *open_error_;
        dirs_ = dirs;
        auto s = std::make_unique<FakeSession>("session-1", &session_closes_);
        session_ = s.get();
        out = std::move(s);
        return imgbuild::Result::Ok();
    }

    imgbuild::Result Solve(const imgbuild::SolveRequest& req,
                           imgbuild::StatusChannel& status,
                           std::stop_token st) override {
        last_request_ = req;
        return fn_(req, status, st);
    }

    void FailOpen(imgbuild::Result r) { open_error_ = std::move(r); }

    // Valid only while the orchestrator is running.
    FakeSession* Session() const { return session_; }
    int SessionCloses() const { return session_closes_.load(); }
    const imgbuild::LocalDirs& Dirs() const { return dirs_; }
    const imgbuild::SolveRequest& LastRequest() const { return last_request_; }

  private:
    SolveFn fn_;
    std::optional<imgbuild::Result> open_error_;
    FakeSession* session_ = nullptr;
    std::atomic_int session_closes_{0};
    imgbuild::LocalDirs dirs_;
    imgbuild::SolveRequest last_request_;
};

} // namespace testutil

#include "imgbuild/status_display.hpp"

#include <cstdarg>
#include <string_view>

namespace imgbuild {

namespace {

double Seconds(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

PlainStatusDisplay::PlainStatusDisplay(std::FILE* out) : out_(out ? out : stdout) {}

PlainStatusDisplay::VertexState& PlainStatusDisplay::StateFor(const std::string& digest) {
    auto [it, inserted] = vertices_.try_emplace(digest);
    if (inserted) it->second.index = next_index_++;
    return it->second;
}

void PlainStatusDisplay::Print(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    if (std::vfprintf(out_, fmt, ap) < 0) write_failed_ = true;
    va_end(ap);
}

Result PlainStatusDisplay::OnStatus(const SolveStatus& status) {
    for (const auto& v : status.vertexes) {
        VertexState& st = StateFor(v.digest);
        if (!v.name.empty()) st.name = v.name;
        if (v.started) st.started = v.started;

        if (!st.announced && (v.started || v.cached)) {
            Print("#%d %s\n", st.index, st.name.c_str());
            st.announced = true;
        }
        if (st.finished) continue;

        if (v.cached) {
            Print("#%d CACHED\n", st.index);
            st.finished = true;
        } else if (!v.error.empty()) {
            Print("#%d ERROR: %s\n", st.index, v.error.c_str());
            st.finished = true;
        } else if (v.completed) {
            if (st.started) {
                Print("#%d DONE %.1fs\n", st.index, Seconds(*st.started, *v.completed));
            } else {
                Print("#%d DONE\n", st.index);
            }
            st.finished = true;
        }
    }

    for (const auto& s : status.statuses) {
        VertexState& st = StateFor(s.vertex);
        const char* done = s.completed ? " done" : "";
        if (s.total > 0) {
            Print("#%d %s %lld/%lld%s\n", st.index, s.name.empty() ? s.id.c_str() : s.name.c_str(),
                  (long long)s.current, (long long)s.total, done);
        } else {
            Print("#%d %s %lld%s\n", st.index, s.name.empty() ? s.id.c_str() : s.name.c_str(),
                  (long long)s.current, done);
        }
    }

    for (const auto& l : status.logs) {
        VertexState& st = StateFor(l.vertex);
        std::string_view text(reinterpret_cast<const char*>(l.data.data()), l.data.size());
        while (!text.empty()) {
            const auto nl = text.find('\n');
            const std::string_view line = text.substr(0, nl);
            Print("#%d %.*s\n", st.index, (int)line.size(), line.data());
            if (nl == std::string_view::npos) break;
            text.remove_prefix(nl + 1);
        }
    }

    std::fflush(out_);
    if (write_failed_) return Result::Fail(EIO, "writing progress output failed");
    return Result::Ok();
}

Result PlainStatusDisplay::Finish() {
    if (std::fflush(out_) != 0 || write_failed_) {
        return Result::Fail(EIO, "writing progress output failed");
    }
    return Result::Ok();
}

} // namespace imgbuild

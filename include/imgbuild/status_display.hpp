#pragma once

#include "imgbuild/status.hpp"
#include "util/result.hpp"

#include <cstdio>
#include <string>
#include <unordered_map>

namespace imgbuild {

// Renderer side of the progress stream. Batches arrive in engine order;
// Finish() is called once after the last batch.
class IStatusDisplay {
  public:
    virtual ~IStatusDisplay() = default;
    virtual Result OnStatus(const SolveStatus& status) = 0;
    virtual Result Finish() { return Result::Ok(); }
};

// Line-oriented output for logs and non-interactive terminals:
//   #3 [2/4] RUN make
//   #3 CACHED
//   #3 DONE 1.2s
class PlainStatusDisplay final : public IStatusDisplay {
  public:
    explicit PlainStatusDisplay(std::FILE* out = stdout);

    Result OnStatus(const SolveStatus& status) override;
    Result Finish() override;

  private:
    struct VertexState {
        int index = 0;
        std::string name;
        bool announced = false;
        bool finished = false;
        std::optional<TimePoint> started;
    };

    VertexState& StateFor(const std::string& digest);
    void Print(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    std::FILE* out_;
    int next_index_ = 1;
    std::unordered_map<std::string, VertexState> vertices_;
    bool write_failed_ = false;
};

} // namespace imgbuild

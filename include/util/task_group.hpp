#pragma once

#include "util/result.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace imgbuild {

// A fixed set of concurrent tasks sharing one stop source. The first task to
// fail records its error and stops the others; Wait() joins every task and
// returns that first error. Stopping `parent` stops the group as well.
class TaskGroup {
  public:
    using Task = std::function<Result(std::stop_token)>;

    explicit TaskGroup(std::stop_token parent = {});
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void Go(Task task);
    Result Wait();

    void Cancel() { stop_.request_stop(); }
    std::stop_token Token() const { return stop_.get_token(); }

  private:
    void Record(Result r);

    std::stop_source stop_;
    std::stop_callback<std::function<void()>> parent_cb_;
    std::vector<std::jthread> workers_;
    std::mutex mu_;
    std::optional<Result> first_err_;
};

} // namespace imgbuild

#include "util/task_group.hpp"

#include <exception>
#include <string>

namespace imgbuild {

TaskGroup::TaskGroup(std::stop_token parent)
    : parent_cb_(parent, std::function<void()>([this] { stop_.request_stop(); })) {}

TaskGroup::~TaskGroup() {
    stop_.request_stop();
    workers_.clear();
}

void TaskGroup::Go(Task task) {
    workers_.emplace_back([this, task = std::move(task)] {
        Result r;
        try {
            r = task(stop_.get_token());
        } catch (const std::exception& e) {
            r = Result::Fail(-1, std::string("task failed: ") + e.what());
        }
        if (!r.is_ok()) Record(std::move(r));
    });
}

Result TaskGroup::Wait() {
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();

    std::lock_guard<std::mutex> lk(mu_);
    return first_err_ ? *first_err_ : Result::Ok();
}

void TaskGroup::Record(Result r) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!first_err_) first_err_ = std::move(r);
    }
    // Stop only after the error is stored, so a sibling that fails because
    // of this stop can never be reported first.
    stop_.request_stop();
}

} // namespace imgbuild

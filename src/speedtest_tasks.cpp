#include "speedtest_tasks.h"

#include <iterator>
#include <utility>

TaskGroup::~TaskGroup() {
    join_all();
}

void TaskGroup::spawn(std::function<void()> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);

    // The list node exists before the thread does, so a joinable thread is
    // never left without an owner.
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.push_back(Task{std::thread(), done});
    try {
        tasks_.back().thread = std::thread([fn = std::move(fn), done] {
            fn();
            done->store(true);
        });
    } catch (...) {
        tasks_.pop_back();
        throw;
    }
}

void TaskGroup::reap_finished() {
    std::list<Task> finished;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), tasks_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& t : finished) t.thread.join();
}

void TaskGroup::join_all() {
    // Tasks may spawn more tasks while we join, so drain until empty.
    while (true) {
        std::list<Task> batch;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (tasks_.empty()) return;
            batch.swap(tasks_);
        }
        for (auto& t : batch) t.thread.join();
    }
}

size_t TaskGroup::running() const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& t : tasks_) {
        if (!t.done->load()) ++n;
    }
    return n;
}

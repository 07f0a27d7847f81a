#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

// A set of threads that can be spawned from any thread, reaped when they
// finish, and joined as a barrier. Destruction joins whatever is left.
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::function<void()> fn);

    // Joins threads that have already returned. Never blocks on a running one.
    void reap_finished();

    void join_all();

    size_t running() const;

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex mu_;
    std::list<Task> tasks_;
};

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Runs work that outlives the request that started it. Each task gets its own
// thread. An exception escaping a task is a fault: it is logged and recorded,
// never delivered to the original caller.
class TaskRunner {
public:
    TaskRunner() = default;
    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;
    ~TaskRunner();

    void spawn(const std::string& name, std::function<void()> task);

    // Blocks until every spawned task has finished.
    void wait_idle();

    std::size_t active() const;
    std::vector<std::string> faults() const;

private:
    void finish(const std::string& name, bool failed, const std::string& fault);

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t active_ = 0;
    std::vector<std::string> faults_;
};

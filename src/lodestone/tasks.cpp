#include "lodestone/tasks.h"

#include <exception>
#include <thread>
#include <utility>

#include "lodestone/options.h"

TaskRunner::~TaskRunner() {
    wait_idle();
}

void TaskRunner::spawn(const std::string& name, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++active_;
    }
    log_debug("Spawning background task '" + name + "'");
    std::thread worker([this, name, task = std::move(task)]() {
        bool failed = false;
        std::string fault;
        try {
            task();
        } catch (const std::exception& e) {
            failed = true;
            fault = e.what();
        }
        finish(name, failed, fault);
    });
    worker.detach();
}

void TaskRunner::finish(const std::string& name, bool failed, const std::string& fault) {
    if (failed) {
        log_error("Background task '" + name + "' failed: " + fault);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed) {
        faults_.push_back(name + ": " + fault);
    }
    --active_;
    idle_.notify_all();
}

void TaskRunner::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return active_ == 0; });
}

std::size_t TaskRunner::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::vector<std::string> TaskRunner::faults() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return faults_;
}
